#pragma once

#include <string>
#include <stdexcept>
#include <exception>

namespace ordguard {

class Error : public std::exception {
    const std::string m_details;
public:
    Error() noexcept = default;
    Error(const Error&) = default;
    Error(Error&&) noexcept = default;
    explicit Error(std::string&& details) noexcept : m_details(std::move(details)) {}
    ~Error() override = default;

    const char* what() const noexcept override  = 0;
    virtual const char* details() const noexcept { return m_details.c_str(); }
};

class KeyError : public Error {
public:
    KeyError() noexcept = default;
    explicit KeyError(std::string&& details) noexcept : Error(std::move(details)) {}
    ~KeyError() override = default;

    const char* what() const noexcept override
    { return "KeyError"; }
};

class TransactionError : public Error {
public:
    explicit TransactionError(std::string&& details) noexcept : Error(std::move(details)) {}
    ~TransactionError() override = default;

    const char* what() const noexcept override
    { return "TransactionError"; }
};

// Malformed or missing caller parameters
class InputError : public Error {
public:
    explicit InputError(std::string&& details) noexcept : Error(std::move(details)) {}
    ~InputError() override = default;

    const char* what() const noexcept override
    { return "InputError"; }
};

class ValidationError : public Error {
public:
    explicit ValidationError(std::string&& details) noexcept : Error(std::move(details)) {}
    ~ValidationError() override = default;

    const char* what() const noexcept override
    { return "ValidationError"; }
};

class InvalidSellerPst : public ValidationError {
public:
    explicit InvalidSellerPst(std::string&& details) noexcept : ValidationError(std::move(details)) {}
    ~InvalidSellerPst() override = default;

    const char* what() const noexcept override
    { return "InvalidSellerPst"; }
};

class InscriptionNotFound : public ValidationError {
public:
    explicit InscriptionNotFound(std::string&& details) noexcept : ValidationError(std::move(details)) {}
    ~InscriptionNotFound() override = default;

    const char* what() const noexcept override
    { return "InscriptionNotFound"; }
};

class InscriptionOwnershipMismatch : public ValidationError {
public:
    explicit InscriptionOwnershipMismatch(std::string&& details) noexcept : ValidationError(std::move(details)) {}
    ~InscriptionOwnershipMismatch() override = default;

    const char* what() const noexcept override
    { return "InscriptionOwnershipMismatch"; }
};

class ResourceError : public Error {
public:
    explicit ResourceError(std::string&& details) noexcept : Error(std::move(details)) {}
    ~ResourceError() override = default;

    const char* what() const noexcept override
    { return "ResourceError"; }
};

class NoSpendableUtxos : public ResourceError {
public:
    explicit NoSpendableUtxos(std::string&& details) noexcept : ResourceError(std::move(details)) {}
    ~NoSpendableUtxos() override = default;

    const char* what() const noexcept override
    { return "NoSpendableUtxos"; }
};

class InsufficientFunds : public ResourceError {
public:
    explicit InsufficientFunds(std::string&& details) noexcept : ResourceError(std::move(details)) {}
    ~InsufficientFunds() override = default;

    const char* what() const noexcept override
    { return "InsufficientFunds"; }
};

class NoOutputSelected : public ResourceError {
public:
    explicit NoOutputSelected(std::string&& details) noexcept : ResourceError(std::move(details)) {}
    ~NoOutputSelected() override = default;

    const char* what() const noexcept override
    { return "NoOutputSelected"; }
};

class ScriptSupportError : public Error {
public:
    explicit ScriptSupportError(std::string&& details) noexcept : Error(std::move(details)) {}
    ~ScriptSupportError() override = default;

    const char* what() const noexcept override
    { return "ScriptSupportError"; }
};

class UnsupportedScriptType : public ScriptSupportError {
public:
    explicit UnsupportedScriptType(std::string&& details) noexcept : ScriptSupportError(std::move(details)) {}
    ~UnsupportedScriptType() override = default;

    const char* what() const noexcept override
    { return "UnsupportedScriptType"; }
};

class AddressDerivationError : public Error {
public:
    explicit AddressDerivationError(std::string&& details) noexcept : Error(std::move(details)) {}
    ~AddressDerivationError() override = default;

    const char* what() const noexcept override
    { return "AddressDerivationError"; }
};

class AddressConstructionError : public AddressDerivationError {
public:
    explicit AddressConstructionError(std::string&& details) noexcept : AddressDerivationError(std::move(details)) {}
    ~AddressConstructionError() override = default;

    const char* what() const noexcept override
    { return "AddressConstructionError"; }
};

class ConvergenceError : public Error {
public:
    explicit ConvergenceError(std::string&& details) noexcept : Error(std::move(details)) {}
    ~ConvergenceError() override = default;

    const char* what() const noexcept override
    { return "ConvergenceError"; }
};

class FeeConvergenceTimeout : public ConvergenceError {
public:
    explicit FeeConvergenceTimeout(std::string&& details) noexcept : ConvergenceError(std::move(details)) {}
    ~FeeConvergenceTimeout() override = default;

    const char* what() const noexcept override
    { return "FeeConvergenceTimeout"; }
};

template <typename STREAM>
void print_error(const Error& e, STREAM& out, size_t level = 0);

template <typename STREAM>
void print_error(const std::exception& e, STREAM& out, size_t level = 0);

template <typename E, typename STREAM>
void rethrow_nested_to_print(const E& e, STREAM& out, size_t level) {
    try {
        std::rethrow_if_nested(e);
    }
    catch (const Error &nested) {
        print_error(nested, out, level+1);
    }
    catch (const std::exception &nested) {
        print_error(nested, out, level+1);
    }

}

template <typename STREAM>
void print_error(const Error& e, STREAM& out, size_t level) {
    out << std::string(level, ' ') << e.what() << ": " << e.details() << "\n";
    rethrow_nested_to_print(e, out, level);
}

template <typename STREAM>
void print_error(const std::exception& e, STREAM& out, size_t level) {
    out << std::string(level, ' ') << e.what() << "\n";
    rethrow_nested_to_print(e, out, level);
}

template <typename STREAM>
void print_error(STREAM& out) noexcept {
    try {
        std::rethrow_exception(std::current_exception());
    }
    catch(const Error& e) {
        print_error(e, out);
    }
    catch(const std::exception& e) {
        print_error(e, out);
    }
}

}
