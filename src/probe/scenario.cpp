#include "mcprobe/probe/scenario.hpp"

#include <algorithm>
#include <cctype>

namespace mcprobe {

std::optional<ExpectedFetch> parse_expected_fetch(std::string_view text) noexcept {
    std::string lowered(text.size(), '\0');
    std::transform(text.begin(), text.end(), lowered.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (lowered == "static") {
        return ExpectedFetch::Static;
    }
    if (lowered == "browser" || lowered == "javascript" || lowered == "js") {
        return ExpectedFetch::Browser;
    }
    if (lowered.empty() || lowered == "any" || lowered == "unspecified") {
        return ExpectedFetch::Unspecified;
    }
    return std::nullopt;
}

std::optional<bool> FetchSuccess::matches(ExpectedFetch expected) const noexcept {
    if (expected == ExpectedFetch::Unspecified || !content.fetch_method.has_value()) {
        return std::nullopt;
    }
    switch (expected) {
        case ExpectedFetch::Static:
            return *content.fetch_method == FetchMethod::Static;
        case ExpectedFetch::Browser:
            return *content.fetch_method == FetchMethod::Browser;
        case ExpectedFetch::Unspecified:
            break;
    }
    return std::nullopt;
}

std::string_view classification(const OutcomeDetail& detail) noexcept {
    switch (detail.index()) {
        case 0: return "Success";
        case 1: return "ApiError";
        default: return "TransportFailure";
    }
}

}  // namespace mcprobe
