#pragma once

#include <optional>
#include <string>
#include <utility>

namespace lexanon
{

// Failure taxonomy surfaced to callers. Overlap ambiguity is not an error
// and is reported through ResolveReport instead.
enum class ErrorKind
{
    Validation, // Malformed entity, empty group, bad replacement
    Conflict,   // Already grouped, duplicate span+source, duplicate id
    NotFound    // Unknown entity or group id
};

inline const char* toString(ErrorKind kind)
{
    switch (kind)
    {
    case ErrorKind::Validation:
        return "ValidationError";
    case ErrorKind::Conflict:
        return "ConflictError";
    case ErrorKind::NotFound:
        return "NotFoundError";
    }
    return "UnknownError";
}

struct EngineError
{
    ErrorKind kind = ErrorKind::Validation;
    std::string message;
};

// Outcome of a mutation that carries a value on success.
template<typename T>
struct Result
{
    std::optional<T> value;
    std::optional<EngineError> error;

    bool succeeded() const { return !error.has_value(); }
    explicit operator bool() const { return succeeded(); }

    const T& operator*() const { return *value; }
    const T* operator->() const { return &*value; }

    static Result success(T v)
    {
        Result res;
        res.value = std::move(v);
        return res;
    }

    static Result failure(ErrorKind kind, std::string message)
    {
        Result res;
        res.error = EngineError{ kind, std::move(message) };
        return res;
    }

    template<typename U>
    static Result propagate(const Result<U>& other)
    {
        Result res;
        res.error = other.error;
        return res;
    }
};

// Outcome of a mutation with no payload.
struct Status
{
    std::optional<EngineError> error;

    bool succeeded() const { return !error.has_value(); }
    explicit operator bool() const { return succeeded(); }

    static Status success() { return Status{}; }

    static Status failure(ErrorKind kind, std::string message)
    {
        Status st;
        st.error = EngineError{ kind, std::move(message) };
        return st;
    }

    template<typename U>
    static Status propagate(const Result<U>& other)
    {
        Status st;
        st.error = other.error;
        return st;
    }
};

} // namespace lexanon
