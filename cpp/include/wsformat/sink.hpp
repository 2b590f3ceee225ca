// ==============================================================================
// wsformat/sink.hpp - Выходной буфер форматтера с откатом
// ==============================================================================
//
// Назначение:
// - Sink: абстрактный буфер, в который можно дописывать байты и откатываться
//   к ранее запомненной позиции (удаление хвостовых пробелов и пустых строк)
// - BufferSink: хранит байты результата
// - CountingSink: хранит только текущую и максимальную позицию; используется
//   для проверки "что изменится" и для расчёта ёмкости BufferSink
//
// ==============================================================================

#ifndef WSFORMAT_SINK_HPP
#define WSFORMAT_SINK_HPP

#include <cstddef>
#include <string>
#include <string_view>

namespace wsformat {

// ----------------------------------------------------------------------------
// Sink - интерфейс
// ----------------------------------------------------------------------------

class Sink {
public:
    virtual ~Sink() = default;

    /// Дописать один байт; позиция увеличивается на 1
    virtual void write(char byte) = 0;

    /// Дописать последовательность байтов
    virtual void write(std::string_view bytes) = 0;

    /// Отбросить все байты после previous_position.
    /// @throws std::out_of_range если previous_position > position()
    virtual void rewind(std::size_t previous_position) = 0;

    /// Текущая длина выхода
    virtual std::size_t position() const = 0;

protected:
    Sink() = default;
};

// ----------------------------------------------------------------------------
// BufferSink - растущий буфер байтов
// ----------------------------------------------------------------------------

class BufferSink : public Sink {
public:
    BufferSink() = default;

    /// Зарезервировать ёмкость заранее (по результату CountingSink)
    explicit BufferSink(std::size_t capacity);

    void write(char byte) override;
    void write(std::string_view bytes) override;
    void rewind(std::size_t previous_position) override;
    std::size_t position() const override { return data_.size(); }

    const std::string& data() const { return data_; }

    /// Забрать результат (буфер становится пустым)
    std::string release();

private:
    std::string data_;
};

// ----------------------------------------------------------------------------
// CountingSink - только счётчик байтов
// ----------------------------------------------------------------------------

class CountingSink : public Sink {
public:
    CountingSink() = default;

    void write(char byte) override;
    void write(std::string_view bytes) override;
    void rewind(std::size_t previous_position) override;
    std::size_t position() const override { return position_; }

    /// Максимальная длина, которой достигал выход
    std::size_t maximum_position() const { return maximum_position_; }

private:
    std::size_t position_ = 0;
    std::size_t maximum_position_ = 0;
};

}  // namespace wsformat

#endif  // WSFORMAT_SINK_HPP
