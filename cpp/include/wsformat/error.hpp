// ==============================================================================
// wsformat/error.hpp - Фатальные ошибки выполнения
// ==============================================================================
//
// Назначение:
// - ErrorKind: классификация ошибок ввода-вывода и конфигурации
// - Error: исключение с типом ошибки и объектом (путь, regex, файл конфигурации)
//
// Ошибки использования CLI сюда не относятся: парсер возвращает диагностику
// (см. cli.hpp). Error перехватывается в main и завершает программу с кодом 1.
//
// ==============================================================================

#ifndef WSFORMAT_ERROR_HPP
#define WSFORMAT_ERROR_HPP

#include <stdexcept>
#include <string>

namespace wsformat {

// ----------------------------------------------------------------------------
// ErrorKind
// ----------------------------------------------------------------------------

enum class ErrorKind {
    FileNotFound,              // входной путь не существует
    DirectoryUnreadable,       // не удалось открыть директорию
    DirectoryEntryUnreadable,  // не удалось прочитать запись директории
    FileUnreadable,            // не удалось прочитать файл
    FileUnwritable,            // не удалось записать файл
    InvalidExcludePattern,     // некорректное регулярное выражение --exclude
    InvalidConfiguration       // некорректный файл --config
};

/// Машинное имя ("file-not-found", ...)
const char* to_string(ErrorKind kind);

// ----------------------------------------------------------------------------
// Error
// ----------------------------------------------------------------------------

class Error : public std::runtime_error {
public:
    /// @param subject Путь, регулярное выражение или файл конфигурации
    /// @param detail Дополнительное пояснение (может быть пустым)
    Error(ErrorKind kind, std::string subject, std::string detail = {});

    ErrorKind kind() const noexcept { return kind_; }
    const std::string& subject() const noexcept { return subject_; }
    const std::string& detail() const noexcept { return detail_; }

private:
    ErrorKind kind_;
    std::string subject_;
    std::string detail_;
};

/// Текст сообщения без префикса "[x] ".
/// Формат: "File not found <path>.", "Cannot read <path>" и т.д.,
/// при непустом detail добавляется " - <detail>"
std::string format_error_message(ErrorKind kind, const std::string& subject,
                                 const std::string& detail);

}  // namespace wsformat

#endif  // WSFORMAT_ERROR_HPP
