#pragma once

#include <functional>
#include <string>
#include <string_view>

// Lets std::string keyed unordered containers be searched with a std::string_view.
struct StringHash {
    using is_transparent = void;
    size_t operator()(std::string_view s) const { return std::hash<std::string_view>{}(s); }
};
