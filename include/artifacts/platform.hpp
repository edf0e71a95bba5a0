// ==============================================================================
// artifacts/platform.hpp - Платформенные абстракции
// ==============================================================================
//
// Назначение:
// - std::filesystem::path ↔ UTF-8 (явные преобразования)
// - Определение TTY stderr для цветного вывода
// - Временные файлы
//
// Платформенная специфика (_WIN32 / POSIX) изолирована в platform.cpp.
//
// ==============================================================================

#ifndef ARTIFACTS_PLATFORM_HPP
#define ARTIFACTS_PLATFORM_HPP

#include <filesystem>
#include <string>
#include <string_view>

namespace artifacts::platform {

/// UTF-8 строка → native path
std::filesystem::path path_from_utf8(std::string_view u8str);

/// native path → UTF-8 строка
std::string path_to_utf8(const std::filesystem::path& p);

/// stderr подключён к терминалу
bool is_tty_stderr();

/// Создать пустой временный файл "<prefix>_XXXXXX<suffix>"
/// @throws std::runtime_error если файл не создан
std::filesystem::path make_temp_file(std::string_view prefix, std::string_view suffix = "");

}  // namespace artifacts::platform

#endif  // ARTIFACTS_PLATFORM_HPP
