#include "mcprobe/protocol/mcp_types.hpp"

#include <algorithm>
#include <cctype>

namespace mcprobe {

namespace {

bool iequals(std::string_view a, std::string_view b) noexcept {
    return std::equal(a.begin(), a.end(), b.begin(), b.end(), [](char x, char y) {
        return std::tolower(static_cast<unsigned char>(x)) ==
               std::tolower(static_cast<unsigned char>(y));
    });
}

JsonError wrong_type(const char* path, const char* expected) {
    return JsonError{
        JsonError::Code::InvalidPayload,
        std::string(path) + " must be " + expected};
}

// Missing and null are the same thing; any other non-matching type is an error
template <typename T, typename Check>
JsonResult<std::optional<T>> optional_member(const Json& parent, const char* key,
                                             const char* path, const char* expected,
                                             Check is_expected) {
    const auto it = parent.find(key);
    if (it == parent.end() || it->is_null()) {
        return std::optional<T>{};
    }
    if (is_expected(*it) == false) {
        return tl::unexpected(wrong_type(path, expected));
    }
    return std::optional<T>{it->template get<T>()};
}

}  // namespace

FetchMethod parse_fetch_method(std::string_view text) noexcept {
    if (iequals(text, "static")) {
        return FetchMethod::Static;
    }
    if (iequals(text, "browser")) {
        return FetchMethod::Browser;
    }
    return FetchMethod::Other;
}

JsonResult<FetchedContent> FetchedContent::from_result(const Json& result) {
    if (result.is_object() == false) {
        return tl::unexpected(wrong_type("result", "an object"));
    }
    const auto content_it = result.find("content");
    if (content_it == result.end() || content_it->is_object() == false) {
        return tl::unexpected(wrong_type("result.content", "an object"));
    }
    const Json& content = *content_it;

    const auto is_string = [](const Json& j) { return j.is_string(); };
    const auto is_bool = [](const Json& j) { return j.is_boolean(); };
    const auto is_integer = [](const Json& j) { return j.is_number_integer(); };

    FetchedContent out;

    auto text = optional_member<std::string>(content, "text_content",
                                             "result.content.text_content", "a string", is_string);
    if (!text) {
        return tl::unexpected(text.error());
    }
    out.text_length = text->has_value() ? (*text)->size() : 0;

    auto title = optional_member<std::string>(content, "title",
                                              "result.content.title", "a string", is_string);
    if (!title) {
        return tl::unexpected(title.error());
    }
    out.title = std::move(*title);

    auto url = optional_member<std::string>(content, "url",
                                            "result.content.url", "a string", is_string);
    if (!url) {
        return tl::unexpected(url.error());
    }
    out.url = std::move(*url);

    const auto metadata_it = content.find("metadata");
    if (metadata_it == content.end() || metadata_it->is_null()) {
        return out;
    }
    if (metadata_it->is_object() == false) {
        return tl::unexpected(wrong_type("result.content.metadata", "an object"));
    }
    const Json& metadata = *metadata_it;

    auto method = optional_member<std::string>(metadata, "fetch_method",
                                               "metadata.fetch_method", "a string", is_string);
    if (!method) {
        return tl::unexpected(method.error());
    }
    if (method->has_value()) {
        out.fetch_method = parse_fetch_method(**method);
        out.fetch_method_raw = std::move(*method);
    }

    auto js = optional_member<bool>(metadata, "javascript_detected",
                                    "metadata.javascript_detected", "a boolean", is_bool);
    if (!js) {
        return tl::unexpected(js.error());
    }
    out.javascript_detected = *js;

    auto status = optional_member<std::int64_t>(metadata, "status_code",
                                                "metadata.status_code", "an integer", is_integer);
    if (!status) {
        return tl::unexpected(status.error());
    }
    out.status_code = *status;

    auto content_type = optional_member<std::string>(metadata, "content_type",
                                                     "metadata.content_type", "a string", is_string);
    if (!content_type) {
        return tl::unexpected(content_type.error());
    }
    out.content_type = std::move(*content_type);

    return out;
}

}  // namespace mcprobe
