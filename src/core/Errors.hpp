#pragma once
#include <stdexcept>
#include <string>

namespace whodat {

// Base of every error the engine throws.
class Error : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

class ProbeError : public Error {
public:
    enum class Code {
        NotADeviceNode,
        PermissionDenied,
        QueryFailed,
        UnsupportedBusType,
    };

    ProbeError(Code code, const std::string& message)
        : Error(message), errorCode(code) {}

    Code code() const { return errorCode; }

private:
    Code errorCode;
};

class BuildError : public Error {
public:
    enum class Code {
        NoSource,
        AmbiguousSource,
        IdMismatch,  // non-fatal, reported in BuildResult::diagnostics
    };

    BuildError(Code code, const std::string& message)
        : Error(message), errorCode(code) {}

    Code code() const { return errorCode; }

private:
    Code errorCode;
};

class SerializeError : public Error {
public:
    enum class Code {
        Incomplete,
    };

    SerializeError(Code code, const std::string& message)
        : Error(message), errorCode(code) {}

    Code code() const { return errorCode; }

private:
    Code errorCode;
};

class DeserializeError : public Error {
public:
    enum class Code {
        MalformedInput,
        UnsupportedVersion,
    };

    DeserializeError(Code code, const std::string& message)
        : Error(message), errorCode(code) {}

    Code code() const { return errorCode; }

private:
    Code errorCode;
};

class RegistryError : public Error {
public:
    enum class Code {
        StaleHandle,
    };

    RegistryError(Code code, const std::string& message)
        : Error(message), errorCode(code) {}

    Code code() const { return errorCode; }

private:
    Code errorCode;
};

const char* toString(ProbeError::Code code);
const char* toString(BuildError::Code code);

} // namespace whodat
