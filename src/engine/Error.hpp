#pragma once

#include <stdexcept>
#include <string>
#include <string_view>

namespace rf
{

enum class ErrorKind
{
    NotFound,
    Conflict,
    Engine,
    Repository,
    Validation,
};

constexpr std::string_view to_string(ErrorKind kind) noexcept
{
    switch (kind)
    {
    case ErrorKind::NotFound:
        return "not_found";
    case ErrorKind::Conflict:
        return "conflict";
    case ErrorKind::Engine:
        return "engine_error";
    case ErrorKind::Repository:
        return "repository_error";
    case ErrorKind::Validation:
        return "validation_error";
    }
    return "unknown";
}

// Typed failure crossing a component boundary. The kind is stable; the
// message is for humans.
class Error : public std::runtime_error
{
  public:
    Error(ErrorKind kind, std::string const &message)
        : std::runtime_error(message), kind_(kind)
    {
    }

    ErrorKind kind() const noexcept
    {
        return kind_;
    }

  private:
    ErrorKind kind_;
};

} // namespace rf
