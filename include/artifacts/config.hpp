// ==============================================================================
// artifacts/config.hpp - Конфигурация читателя
// ==============================================================================
//
// Назначение:
// - ReaderConfig: параметры чтения со значениями по умолчанию
// - Загрузка из YAML (yaml-cpp), ошибки как значения
//
// Формат файла:
//
//   validate_checksums: true
//   record_recovery: stop        # stop | scan
//   message_separator: " | "
//   message_limit: 200
//   max_diagnostics: 256
//   output:
//     quiet: false
//     verbose: 0
//     log_path: /var/log/artifacts.log
//
// Неизвестные ключи отклоняются.
//
// ==============================================================================

#ifndef ARTIFACTS_CONFIG_HPP
#define ARTIFACTS_CONFIG_HPP

#include <artifacts/event.hpp>
#include <artifacts/output.hpp>
#include <artifacts/record.hpp>

#include <cstddef>
#include <filesystem>
#include <string>

namespace artifacts {

struct ReaderConfig {
    bool validate_checksums = true;
    RecoveryPolicy record_recovery = RecoveryPolicy::Stop;
    std::string message_separator = DEFAULT_MESSAGE_SEPARATOR;
    std::size_t message_limit = DEFAULT_MESSAGE_LIMIT;
    std::size_t max_diagnostics = 256;
    output::OutputConfig output;

    /// Параметры EventExtractor
    ExtractorOptions extractor_options() const;
};

struct ConfigError {
    std::string message;
    std::string context;  // путь к файлу или ключ

    std::string format() const;
};

struct ConfigResult {
    bool ok = false;
    ReaderConfig config;
    ConfigError error;

    explicit operator bool() const { return ok; }
};

/// Разобрать YAML текст (пустой документ → значения по умолчанию)
ConfigResult parse_config(const std::string& yaml_text);

/// Загрузить YAML файл
ConfigResult load_config(const std::filesystem::path& path);

}  // namespace artifacts

#endif  // ARTIFACTS_CONFIG_HPP
