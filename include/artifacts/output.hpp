// ==============================================================================
// artifacts/output.hpp - Диагностический вывод
// ==============================================================================
//
// Назначение:
// - Единственная точка записи в stderr
// - Уровни журнала с префиксами: [x] error, [!] warning, [+] info,
//   [*] debug, [~] trace
// - ANSI цвет префикса, если stderr является терминалом
// - Файл журнала (log_path) вместо stderr
//
// Читатель EVTX пишет сюда через Writer* из OpenOptions, а без него через
// собственный Writer из ReaderConfig::output: повреждённые чанки и записи
// как предупреждения, отброшенные записи как debug, кеш шаблонов как trace.
//
// ==============================================================================

#ifndef ARTIFACTS_OUTPUT_HPP
#define ARTIFACTS_OUTPUT_HPP

#include <cstdio>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>

namespace artifacts::output {

/// Уровень сообщения, по убыванию важности
enum class Level { Error, Warning, Info, Debug, Trace };

enum class Color { Default, Green, Yellow, Red, Cyan, Magenta };

/// Префикс уровня: "[x] ", "[!] ", "[+] ", "[*] ", "[~] "
const char* level_prefix(Level level);

Color level_color(Level level);

struct OutputConfig {
    bool quiet = false;  // без info и warning
    int verbose = 0;     // 1: debug, 2+: trace

    std::optional<std::filesystem::path> log_path;
};

/// Пропускает ли конфигурация сообщения уровня level
bool level_enabled(const OutputConfig& config, Level level);

// ----------------------------------------------------------------------------
// Writer
// ----------------------------------------------------------------------------

class Writer {
public:
    explicit Writer(const OutputConfig& cfg);
    ~Writer();

    Writer(const Writer&) = delete;
    Writer& operator=(const Writer&) = delete;

    /// Сообщение с префиксом уровня; отфильтрованные уровни не пишутся
    void log(Level level, std::string_view message);

    void error(std::string_view message) { log(Level::Error, message); }
    void warn(std::string_view message) { log(Level::Warning, message); }
    void warning(std::string_view message) { log(Level::Warning, message); }
    void info(std::string_view message) { log(Level::Info, message); }
    void debug(std::string_view message) { log(Level::Debug, message); }
    void trace(std::string_view message) { log(Level::Trace, message); }

    void flush();

    const OutputConfig& config() const { return config_; }

    bool has_log_file() const { return log_file_ != nullptr; }

private:
    /// Файл журнала, если открыт, иначе stderr
    void emit(std::string_view bytes);

    OutputConfig config_;
    FILE* log_file_ = nullptr;  // владеет, закрывается в деструкторе
    bool color_ = false;
};

// ----------------------------------------------------------------------------
// Форматирование
// ----------------------------------------------------------------------------

/// "<prefix><message>\n" без цвета
std::string format_line(Level level, std::string_view message);

std::string ansi_color_code(Color color);
std::string ansi_reset_code();

/// Терминал ли stderr
bool supports_color();

}  // namespace artifacts::output

#endif  // ARTIFACTS_OUTPUT_HPP
