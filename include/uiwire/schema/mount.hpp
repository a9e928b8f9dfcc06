#pragma once

#include <optional>
#include <string>

#include "uiwire/json/traits.hpp"


namespace uiwire::schema {

// Payload of the session bootstrap event: {"token": string|null}
struct MountData {
    std::optional<std::string> token;
};

} // namespace uiwire::schema


namespace uiwire::json {

template<>
struct Traits<schema::MountData> {
    [[nodiscard]] static bool parse(const simdjson::dom::element& el, schema::MountData& out, std::string& why) {
        return read_field(el, "token", out.token, why);
    }
    static void write(std::string& out, const schema::MountData& v) {
        out += '{';
        write_field(out, "token", v.token);
        out += '}';
    }
};

} // namespace uiwire::json
