/**
 * Diario - Journal Window Implementation
 *
 * SPDX-License-Identifier: GPL-3.0-or-later
 */

#include "JournalWindow.hpp"
#include "core/JournalStore.hpp"
#include "core/PathConversion.hpp"
#include "core/config/ConfigManager.hpp"
#include "export/EntryExporter.hpp"

#include <QCloseEvent>
#include <QColorDialog>
#include <QFileDialog>
#include <QFileInfo>
#include <QHBoxLayout>
#include <QKeySequence>
#include <QLocale>
#include <QMessageBox>
#include <QShortcut>
#include <QSplitter>
#include <QStyle>
#include <QVBoxLayout>

#include <spdlog/spdlog.h>

namespace diario {

JournalWindow::JournalWindow(JournalStore& store, ConfigManager& config, QWidget* parent)
    : QMainWindow(parent)
    , m_store(store)
    , m_config(config)
    , m_currentDate(QDate::currentDate())
    , m_backgroundColor(QString::fromStdString(config.programConfig().backgroundColor))
{
    setWindowTitle(QStringLiteral("Journal & Poetry"));
    resize(960, 600);
    setupUi();
    refreshDateList();
    loadEntry(m_currentDate);
    selectDateInList(m_currentDate);
}

void JournalWindow::setupUi() {
    auto* central = new QWidget(this);
    auto* mainLayout = new QVBoxLayout(central);
    mainLayout->setContentsMargins(12, 12, 12, 12);

    // Header - current date and jump to today
    auto* headerLayout = new QHBoxLayout();
    m_dateLabel = new QLabel();
    m_dateLabel->setStyleSheet("font-weight: bold; font-size: 18px;");
    headerLayout->addWidget(m_dateLabel);
    headerLayout->addStretch();
    m_todayBtn = new QPushButton("Today");
    headerLayout->addWidget(m_todayBtn);
    mainLayout->addLayout(headerLayout);

    auto* splitter = new QSplitter(Qt::Horizontal, central);

    // Left panel - Date list
    auto* leftWidget = new QWidget();
    auto* leftLayout = new QVBoxLayout(leftWidget);
    leftLayout->setContentsMargins(0, 0, 0, 0);

    auto* listLabel = new QLabel("Available entries");
    listLabel->setStyleSheet("font-weight: bold; font-size: 14px;");
    leftLayout->addWidget(listLabel);

    m_dateList = new QListWidget();
    m_dateList->setMinimumWidth(160);
    leftLayout->addWidget(m_dateList);

    splitter->addWidget(leftWidget);

    // Right panel - Editors
    m_tabs = new QTabWidget();
    const QFont editorFont(QStringLiteral("Georgia"), 14);

    m_journalEdit = new QTextEdit();
    m_journalEdit->setAcceptRichText(false);
    m_journalEdit->setFont(editorFont);
    m_journalEdit->setPlaceholderText("Write about your day...");

    m_poetryEdit = new QTextEdit();
    m_poetryEdit->setAcceptRichText(false);
    m_poetryEdit->setFont(editorFont);
    m_poetryEdit->setPlaceholderText("Write a poem...");

    m_tabs->addTab(m_journalEdit, "Journal");
    m_tabs->addTab(m_poetryEdit, QStringLiteral("Poetry"));
    splitter->addWidget(m_tabs);

    splitter->setSizes({180, 780});
    mainLayout->addWidget(splitter, 1);

    // Toolbar
    auto* toolbarLayout = new QHBoxLayout();
    m_saveBtn = new QPushButton("Save");
    m_saveBtn->setIcon(style()->standardIcon(QStyle::SP_DialogSaveButton));
    m_backgroundBtn = new QPushButton("Change background");
    m_exportBtn = new QPushButton("Export");
    toolbarLayout->addWidget(m_saveBtn);
    toolbarLayout->addWidget(m_backgroundBtn);
    toolbarLayout->addWidget(m_exportBtn);
    toolbarLayout->addStretch();
    mainLayout->addLayout(toolbarLayout);

    setCentralWidget(central);
    applyBackgroundColor();

    // Connect signals
    connect(m_todayBtn, &QPushButton::clicked, this, &JournalWindow::onGoToToday);
    connect(m_saveBtn, &QPushButton::clicked, this, &JournalWindow::onSaveEntry);
    connect(m_backgroundBtn, &QPushButton::clicked, this, &JournalWindow::onChangeBackground);
    connect(m_exportBtn, &QPushButton::clicked, this, &JournalWindow::onExportEntry);
    connect(m_dateList, &QListWidget::currentItemChanged,
            this, &JournalWindow::onDateSelected);

    auto* saveShortcut = new QShortcut(QKeySequence::Save, this);
    connect(saveShortcut, &QShortcut::activated, this, &JournalWindow::onSaveEntry);
}

void JournalWindow::refreshDateList() {
    const QSignalBlocker blocker(m_dateList);
    m_dateList->clear();

    // Newest first
    const auto dates = m_store.listDates();
    for (auto it = dates.rbegin(); it != dates.rend(); ++it) {
        auto* item = new QListWidgetItem(it->toString(Qt::ISODate));
        item->setData(Qt::UserRole, *it);
        m_dateList->addItem(item);
    }
}

void JournalWindow::selectDateInList(const QDate& date) {
    const QSignalBlocker blocker(m_dateList);
    for (int i = 0; i < m_dateList->count(); ++i) {
        auto* item = m_dateList->item(i);
        if (item->data(Qt::UserRole).toDate() == date) {
            m_dateList->setCurrentItem(item);
            m_dateList->scrollToItem(item);
            break;
        }
    }
}

void JournalWindow::switchToDate(const QDate& date) {
    if (!date.isValid()) return;

    saveCurrentEntry();
    m_currentDate = date;

    const bool isNew = !m_store.contains(date);
    loadEntry(date);
    if (isNew) {
        refreshDateList();
    }
    selectDateInList(date);
}

void JournalWindow::loadEntry(const QDate& date) {
    const JournalEntry entry = m_store.get(date).value_or(JournalEntry{});

    m_dateLabel->setText(QLocale().toString(date, QLocale::LongFormat));
    m_journalEdit->setPlainText(entry.journal);
    m_poetryEdit->setPlainText(entry.poetry);
}

bool JournalWindow::saveCurrentEntry() {
    auto error = m_store.put(m_currentDate, JournalEntry::create(m_journalEdit->toPlainText(),
                                                                 m_poetryEdit->toPlainText()));
    if (!error) {
        error = m_store.save();
    }
    if (error) {
        QMessageBox::critical(this, "Save failed",
            QString("The journal could not be saved.\n\n%1")
                .arg(QString::fromStdString(error->message)));
        return false;
    }
    return true;
}

void JournalWindow::onSaveEntry() {
    if (saveCurrentEntry()) {
        QMessageBox::information(this, "Saved",
            QString("Saved the entry for %1.").arg(m_currentDate.toString(Qt::ISODate)));
    }
}

void JournalWindow::onGoToToday() {
    const QDate today = QDate::currentDate();

    // The session may have crossed midnight since startup
    if (!m_store.contains(today)) {
        saveCurrentEntry();
        auto error = m_store.ensureBackfilled(today);
        if (error) {
            spdlog::warn("Backfill save failed: {}", error->message);
            QMessageBox::warning(this, "Save failed", QString::fromStdString(error->message));
        }
        refreshDateList();
    }
    switchToDate(today);
}

void JournalWindow::onDateSelected(QListWidgetItem* current, QListWidgetItem* previous) {
    Q_UNUSED(previous);

    if (!current) return;

    const QDate date = current->data(Qt::UserRole).toDate();
    if (date != m_currentDate) {
        switchToDate(date);
    }
}

void JournalWindow::applyBackgroundColor() {
    const QString sheet = QString("QTextEdit { background-color: %1; }").arg(m_backgroundColor);
    m_journalEdit->setStyleSheet(sheet);
    m_poetryEdit->setStyleSheet(sheet);
}

void JournalWindow::onChangeBackground() {
    const QColor color = QColorDialog::getColor(QColor(m_backgroundColor), this, "Select a color");
    if (!color.isValid()) return;

    m_backgroundColor = color.name();
    applyBackgroundColor();

    ProgramConfig config = m_config.programConfig();
    config.backgroundColor = m_backgroundColor.toStdString();
    if (!m_config.setProgramConfig(config)) {
        spdlog::warn("Background color was not persisted");
    }
}

void JournalWindow::onExportEntry() {
    saveCurrentEntry();

    const QString suggested = toQString(
        m_config.exportDirectoryPath() / toPath(EntryExporter::defaultFileName(m_currentDate)));

    QString filter = "Text (*.txt);;Markdown (*.md)";
    if (EntryExporter::isPdfSupported()) {
        filter += ";;PDF (*.pdf)";
    }

    const QString fileName = QFileDialog::getSaveFileName(this, "Export entry", suggested, filter);
    if (fileName.isEmpty()) return;

    const std::filesystem::path path = toPath(fileName);
    auto error = EntryExporter::exportEntry(path, m_currentDate,
                                            m_store.get(m_currentDate).value_or(JournalEntry{}));
    if (error) {
        const QString details = QString::fromStdString(error->message);
        if (error->code == ExportErrorCode::MissingCapability) {
            QMessageBox::warning(this, "Export unavailable", details);
        } else {
            QMessageBox::critical(this, "Export failed",
                QString("The file could not be exported.\n\n%1").arg(details));
        }
        return;
    }

    ProgramConfig config = m_config.programConfig();
    config.exportDirectory = QFileInfo(fileName).absolutePath().toStdString(); // UTF-8
    if (!m_config.setProgramConfig(config)) {
        spdlog::warn("Export directory was not persisted");
    }

    QMessageBox::information(this, "Export complete",
        QString("Exported the entry to %1.").arg(fileName));
}

void JournalWindow::closeEvent(QCloseEvent* event) {
    // Save state before closing
    saveCurrentEntry();
    if (!m_config.save()) {
        spdlog::warn("Settings were not saved on close");
    }

    QMainWindow::closeEvent(event);
}

} // namespace diario
