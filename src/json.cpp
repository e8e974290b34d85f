#include <longcursor-cpp/json.hpp>

#include <array>
#include <stdexcept>
#include <string>
#include <utility>

namespace longcursor_cpp {

namespace {

constexpr auto all_error_kinds = std::array{
    ErrorKind::no_such_element,
    ErrorKind::illegal_state,
    ErrorKind::unsupported_operation,
    ErrorKind::concurrent_modification,
};

}  // namespace

void to_json(nlohmann::json& j, ErrorKind kind) {
    j = std::string{to_string_view(kind)};
}

void from_json(const nlohmann::json& j, ErrorKind& kind) {
    if (!j.is_string()) throw std::runtime_error{"error kind must be a string"};
    const auto& name = j.get_ref<const std::string&>();
    for (auto candidate : all_error_kinds) {
        if (to_string_view(candidate) == name) {
            kind = candidate;
            return;
        }
    }
    throw std::runtime_error{"unknown error kind: " + name};
}

void to_json(nlohmann::json& j, const Error& err) {
    j = nlohmann::json{{"kind", err.kind}, {"message", err.message}};
}

auto error_from_json(const nlohmann::json& j) -> Error {
    if (!j.is_object()) throw std::runtime_error{"error must be a JSON object"};
    if (!j.contains("kind")) throw std::runtime_error{"error is missing \"kind\""};

    auto kind = ErrorKind::illegal_state;
    from_json(j.at("kind"), kind);

    auto message = std::string{};
    if (j.contains("message")) {
        if (!j.at("message").is_string()) {
            throw std::runtime_error{"error message must be a string"};
        }
        message = j.at("message").get<std::string>();
    }
    return Error{kind, std::move(message)};
}

void to_json(nlohmann::json& j, CursorState state) {
    j = std::string{to_string_view(state)};
}

auto drain_json(LongCursor& cursor) -> nlohmann::json {
    auto arr = nlohmann::json::array();
    while (cursor.has_more()) {
        arr.push_back(cursor.next());
    }
    return arr;
}

}  // namespace longcursor_cpp
