/// @file error.cpp
/// @brief Error formatting for treepath_core

#include <treepath/core/error.hpp>

#include <sstream>

namespace treepath_core {

namespace {

struct KindLabel {
    const char* operator()(const std::string&) const { return nullptr; }
    const char* operator()(const SchemaError&) const { return "SchemaError"; }
    const char* operator()(const PathError&) const { return "PathError"; }
    const char* operator()(const TypeMismatchError&) const { return "TypeMismatchError"; }
    const char* operator()(const MutationError&) const { return "MutationError"; }
    const char* operator()(const ValidationError&) const { return "ValidationError"; }
};

/// Address the error is about, when the message does not already name it
std::string subject_of(const Error::Variant& detail) {
    if (const auto* err = std::get_if<SchemaError>(&detail)) {
        return err->path;
    }
    if (const auto* err = std::get_if<PathError>(&detail)) {
        return err->field;
    }
    return {};
}

} // namespace

std::string build_error_chain(const Error& error) {
    std::ostringstream out;
    out << "[" << error_code_name(error.code()) << "] ";

    if (const char* label = std::visit(KindLabel{}, error.variant())) {
        out << "[" << label << "] ";
    }

    const std::string message = error.message();
    out << message;

    const std::string subject = subject_of(error.variant());
    if (!subject.empty() && message.find(subject) == std::string::npos) {
        out << " (at " << subject << ")";
    }

    for (const auto& [key, value] : error.context()) {
        out << "\n  " << key << ": " << value;
    }
    return out.str();
}

} // namespace treepath_core
