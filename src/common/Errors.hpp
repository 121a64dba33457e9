#pragma once

#include <stdexcept>
#include <string>

class WasmixException : public std::runtime_error {
public:
    explicit WasmixException(const std::string& message) : std::runtime_error(message) {}
};

// No input device granted access.
class DeviceUnavailable : public WasmixException {
public:
    using WasmixException::WasmixException;
};

// Device and configuration share no acceptable sample rate.
class DeviceConfigRejected : public WasmixException {
public:
    using WasmixException::WasmixException;
};

// Capture state machine misuse.
class InvalidState : public WasmixException {
public:
    using WasmixException::WasmixException;
};

class WriteError : public WasmixException {
public:
    using WasmixException::WasmixException;
};

class NotFound : public WasmixException {
public:
    using WasmixException::WasmixException;
};

class JournalError : public WasmixException {
public:
    using WasmixException::WasmixException;
};
