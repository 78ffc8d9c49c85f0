#pragma once

#include <QString>

#include <array>
#include <functional>

class RunLog;

/**
 * Best-effort secure deletion: every byte of a file is overwritten with six
 * fixed patterns and one random pass before the file is unlinked. This does
 * not defend against copy-on-write or wear-leveled storage.
 */
namespace SecureEraser {

constexpr std::array<unsigned char, 6> fixedPassValues = {0xFF, 0x00, 0xAA, 0x55, 0xF0, 0x0F};
constexpr int passCount = static_cast<int>(fixedPassValues.size()) + 1;

// Called after each completed pass, before the next one starts.
using PassCallback = std::function<void(int passIndex, const QString &path)>;

bool eraseFile(const QString &path, RunLog *log, QString *error, const PassCallback &onPass = PassCallback());
bool eraseFolder(const QString &path, RunLog *log, QString *error, const PassCallback &onPass = PassCallback());

} // namespace SecureEraser
