/**
 * Diario - Path Conversion
 *
 * Lossless conversion between std::filesystem::path and QString.
 * path::string() uses the ANSI code page on Windows, so go through UTF-16.
 *
 * SPDX-License-Identifier: GPL-3.0-or-later
 */

#pragma once

#include <filesystem>
#include <string>

#include <QString>

namespace diario {

inline QString toQString(const std::filesystem::path& path) {
    return QString::fromStdU16String(path.u16string());
}

inline std::filesystem::path toPath(const QString& path) {
    return std::filesystem::path(path.toStdU16String());
}

/**
 * UTF-8 rendering for log lines and error messages; never throws on
 * characters outside the system code page
 */
inline std::string displayPath(const std::filesystem::path& path) {
    return toQString(path).toStdString();
}

} // namespace diario
