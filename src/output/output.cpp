// ==============================================================================
// output.cpp - Диагностический вывод
// ==============================================================================
//
// Запись только через fwrite: без iostream и без std::endl.
//
// ==============================================================================

#include <artifacts/output.hpp>
#include <artifacts/platform.hpp>

#include <cstdio>

namespace artifacts::output {

namespace {

struct LevelStyle {
    const char* prefix;
    Color color;
};

// Порядок совпадает с enum Level
constexpr LevelStyle LEVEL_STYLES[] = {
    {"[x] ", Color::Red},   {"[!] ", Color::Yellow},  {"[+] ", Color::Green},
    {"[*] ", Color::Cyan},  {"[~] ", Color::Magenta},
};

const LevelStyle& style(Level level) {
    return LEVEL_STYLES[static_cast<int>(level)];
}

FILE* open_append(const std::filesystem::path& path) {
#ifdef _WIN32
    return _wfopen(path.c_str(), L"ab");
#else
    return std::fopen(platform::path_to_utf8(path).c_str(), "ab");
#endif
}

}  // namespace

const char* level_prefix(Level level) {
    return style(level).prefix;
}

Color level_color(Level level) {
    return style(level).color;
}

bool level_enabled(const OutputConfig& config, Level level) {
    switch (level) {
    case Level::Error:
        return true;
    case Level::Warning:
    case Level::Info:
        return !config.quiet;
    case Level::Debug:
        return config.verbose >= 1;
    case Level::Trace:
        return config.verbose >= 2;
    }
    return false;
}

// ----------------------------------------------------------------------------
// Writer
// ----------------------------------------------------------------------------

Writer::Writer(const OutputConfig& cfg) : config_(cfg) {
    if (config_.log_path) {
        log_file_ = open_append(*config_.log_path);
    }
    color_ = log_file_ == nullptr && supports_color();

    if (config_.log_path && log_file_ == nullptr) {
        // Журнал недоступен: диагностики остаются в stderr
        warn("cannot open log file " + platform::path_to_utf8(*config_.log_path));
    }
}

Writer::~Writer() {
    flush();
    if (log_file_ != nullptr) {
        std::fclose(log_file_);
    }
}

void Writer::emit(std::string_view bytes) {
    FILE* out = log_file_ != nullptr ? log_file_ : stderr;
    std::fwrite(bytes.data(), 1, bytes.size(), out);
}

void Writer::log(Level level, std::string_view message) {
    if (!level_enabled(config_, level)) {
        return;
    }
    if (color_) {
        emit(ansi_color_code(level_color(level)));
        emit(level_prefix(level));
        emit(ansi_reset_code());
        emit(message);
        emit("\n");
        return;
    }
    emit(format_line(level, message));
}

void Writer::flush() {
    std::fflush(stderr);
    if (log_file_ != nullptr) {
        std::fflush(log_file_);
    }
}

// ----------------------------------------------------------------------------
// Форматирование
// ----------------------------------------------------------------------------

std::string format_line(Level level, std::string_view message) {
    std::string line = level_prefix(level);
    line.append(message);
    line.push_back('\n');
    return line;
}

std::string ansi_color_code(Color color) {
    switch (color) {
    case Color::Red:
        return "\x1b[31m";
    case Color::Green:
        return "\x1b[32m";
    case Color::Yellow:
        return "\x1b[33m";
    case Color::Magenta:
        return "\x1b[35m";
    case Color::Cyan:
        return "\x1b[36m";
    case Color::Default:
        break;
    }
    return "";
}

std::string ansi_reset_code() {
    return "\x1b[0m";
}

bool supports_color() {
    return platform::is_tty_stderr();
}

}  // namespace artifacts::output
