#pragma once

#include <cstdint>
#include <string>
#include <utility>
#include <variant>

namespace vmc {

enum class Error
{
    ARGUMENT,
    CONNECTION,
    PROTOCOL,
    TIMEOUT,
    HARDWARE_FAULT
};

const char* error_name(Error error);

struct Failure
{
    Error error;
    std::string message;
    uint8_t fault_code = 0;     // only set for HARDWARE_FAULT
};

template<typename T>
class Result
{
public:
    bool ok() const
    {
        return std::holds_alternative<T>(data_);
    }

    const T& value() const
    {
        return std::get<T>(data_);
    }

    const T* value_if() const
    {
        return std::get_if<T>(&data_);
    }

    Error error() const
    {
        return std::get<Failure>(data_).error;
    }

    const std::string& message() const
    {
        return std::get<Failure>(data_).message;
    }

    const Failure& failure_info() const
    {
        return std::get<Failure>(data_);
    }

    static Result success(T value)
    {
        return Result(std::move(value));
    }

    static Result failure(Error error, std::string message = {})
    {
        return Result(Failure{error, std::move(message)});
    }

    static Result failure(Failure failure)
    {
        return Result(std::move(failure));
    }

    static Result fault(uint8_t code, std::string message)
    {
        return Result(Failure{Error::HARDWARE_FAULT, std::move(message), code});
    }

private:
    std::variant<T, Failure> data_;

    explicit Result(T value) : data_(std::move(value)) {}
    explicit Result(Failure failure) : data_(std::move(failure)) {}
};

} // namespace vmc
