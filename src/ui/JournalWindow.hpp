/**
 * Diario - Journal Window
 *
 * Main window for reading and writing daily journal and poetry entries.
 *
 * SPDX-License-Identifier: GPL-3.0-or-later
 */

#pragma once

#include <QDate>
#include <QLabel>
#include <QListWidget>
#include <QMainWindow>
#include <QPushButton>
#include <QTabWidget>
#include <QTextEdit>

namespace diario {

class ConfigManager;
class JournalStore;

/**
 * Journal window
 *
 * Features a newest-first list of dates on the left and a tabbed
 * journal/poetry editor on the right. Every save goes straight to the
 * store's backing file.
 */
class JournalWindow : public QMainWindow {
    Q_OBJECT

public:
    JournalWindow(JournalStore& store, ConfigManager& config, QWidget* parent = nullptr);
    ~JournalWindow() override = default;

    /**
     * Show a date in the editor, saving the current one first
     */
    void switchToDate(const QDate& date);

    QDate currentDate() const { return m_currentDate; }

protected:
    void closeEvent(QCloseEvent* event) override;

private slots:
    void onGoToToday();
    void onSaveEntry();
    void onChangeBackground();
    void onExportEntry();
    void onDateSelected(QListWidgetItem* current, QListWidgetItem* previous);
    void refreshDateList();

private:
    void setupUi();
    void loadEntry(const QDate& date);
    bool saveCurrentEntry();
    void selectDateInList(const QDate& date);
    void applyBackgroundColor();

    JournalStore& m_store;
    ConfigManager& m_config;

    QLabel* m_dateLabel;
    QPushButton* m_todayBtn;
    QListWidget* m_dateList;
    QTabWidget* m_tabs;
    QTextEdit* m_journalEdit;
    QTextEdit* m_poetryEdit;
    QPushButton* m_saveBtn;
    QPushButton* m_backgroundBtn;
    QPushButton* m_exportBtn;

    QDate m_currentDate;
    QString m_backgroundColor;
};

} // namespace diario
