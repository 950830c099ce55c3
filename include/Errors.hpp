#pragma once
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

// Base of every error the account layer reports to callers.
class FitTrackError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// Bad email / password / name / date shape. Holds each violated rule.
class ValidationError : public FitTrackError {
public:
    explicit ValidationError(std::vector<std::string> errors)
        : FitTrackError(join(errors)), m_errors(std::move(errors)) {}

    explicit ValidationError(const std::string& error)
        : ValidationError(std::vector<std::string>{ error }) {}

    const std::vector<std::string>& errors() const { return m_errors; }

private:
    static std::string join(const std::vector<std::string>& errors) {
        std::string out;
        for (const auto& e : errors) {
            if (!out.empty()) out += ". ";
            out += e;
        }
        return out;
    }

    std::vector<std::string> m_errors;
};

class DuplicateEmailError : public FitTrackError {
public:
    DuplicateEmailError() : FitTrackError("Email already registered") {}
};

// Unknown email and wrong password share this type and message.
class InvalidCredentialsError : public FitTrackError {
public:
    InvalidCredentialsError() : FitTrackError("Invalid email or password") {}
    explicit InvalidCredentialsError(const std::string& msg) : FitTrackError(msg) {}
};

class NotFoundError : public FitTrackError {
public:
    using FitTrackError::FitTrackError;
};

// Any failure reported by SQLite. code() is the extended result code.
class StorageError : public FitTrackError {
public:
    StorageError(const std::string& msg, int code)
        : FitTrackError(msg), m_code(code) {}

    int code() const { return m_code; }
    bool isUniqueViolation() const;

private:
    int m_code;
};
