// ==============================================================================
// platform.cpp - Платформенные абстракции
// ==============================================================================
//
// Вся _WIN32 / POSIX специфика модуля собрана здесь.
//
// ==============================================================================

#include <artifacts/platform.hpp>

#include <cstdio>
#include <random>
#include <stdexcept>
#include <system_error>

#ifdef _WIN32
#include <io.h>
#define NOMINMAX
#include <windows.h>
#else
#include <cerrno>
#include <cstdlib>
#include <unistd.h>
#endif

namespace artifacts::platform {

namespace {

/// Каталог для временных файлов (TMPDIR на POSIX, GetTempPath на Windows)
std::filesystem::path temp_root() {
    std::error_code ec;
    std::filesystem::path dir = std::filesystem::temp_directory_path(ec);
    if (ec) {
        throw std::runtime_error("no temporary directory: " + ec.message());
    }
    return dir;
}

int stream_fd(FILE* stream) {
#ifdef _WIN32
    return _fileno(stream);
#else
    return fileno(stream);
#endif
}

bool fd_is_tty(int fd) {
#ifdef _WIN32
    return _isatty(fd) != 0;
#else
    return isatty(fd) != 0;
#endif
}

}  // namespace

// ----------------------------------------------------------------------------
// Пути
// ----------------------------------------------------------------------------

std::filesystem::path path_from_utf8(std::string_view u8str) {
    // u8path: UTF-8 → UTF-16 на Windows, без преобразования на POSIX
    return std::filesystem::u8path(u8str.begin(), u8str.end());
}

std::string path_to_utf8(const std::filesystem::path& p) {
    return p.u8string();
}

// ----------------------------------------------------------------------------
// TTY
// ----------------------------------------------------------------------------

bool is_tty_stderr() {
    return fd_is_tty(stream_fd(stderr));
}

// ----------------------------------------------------------------------------
// Временные файлы
// ----------------------------------------------------------------------------

std::filesystem::path make_temp_file(std::string_view prefix, std::string_view suffix) {
    const std::filesystem::path dir = temp_root();

#ifdef _WIN32
    std::random_device rd;
    std::mt19937 gen(rd());
    std::uniform_int_distribution<unsigned> nibble(0, 15);

    for (int attempt = 0; attempt < 16; ++attempt) {
        std::string name(prefix);
        name += '_';
        for (int i = 0; i < 6; ++i) {
            name += "0123456789abcdef"[nibble(gen)];
        }
        name += suffix;

        std::filesystem::path candidate = dir / path_from_utf8(name);
        HANDLE handle = CreateFileW(candidate.c_str(), GENERIC_WRITE, 0, nullptr, CREATE_NEW,
                                    FILE_ATTRIBUTE_NORMAL, nullptr);
        if (handle != INVALID_HANDLE_VALUE) {
            CloseHandle(handle);
            return candidate;
        }
    }
    throw std::runtime_error("cannot create temporary file in " + path_to_utf8(dir));
#else
    std::string pattern = path_to_utf8(dir / (std::string(prefix) + "_XXXXXX" + std::string(suffix)));

    // mkstemps заменяет XXXXXX на месте
    int fd = mkstemps(pattern.data(), static_cast<int>(suffix.size()));
    if (fd < 0) {
        throw std::system_error(errno, std::generic_category(),
                                "cannot create temporary file " + pattern);
    }
    close(fd);
    return path_from_utf8(pattern);
#endif
}

}  // namespace artifacts::platform
