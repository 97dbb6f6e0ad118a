#pragma once

#include <string>
#include <utility>

namespace SC {

struct FontFamily {
    enum class Kind {
        System,
        Sans,
        Mono,
        Serif,
        Brand,
        Custom,
    };

    Kind        kind{Kind::System};
    std::string name;
    Kind        fallback{Kind::Sans};

    static auto Custom(std::string name, Kind fallback = Kind::Sans) -> FontFamily {
        return FontFamily{Kind::Custom, std::move(name), fallback};
    }

    auto operator==(FontFamily const&) const -> bool = default;
};

enum class FontWeight {
    Thin,
    Light,
    Regular,
    Medium,
    Semibold,
    Bold,
    Black,
};

enum class TextAlign {
    Start,
    Center,
    End,
    Justify,
};

enum class TextTransform {
    None,
    Uppercase,
    Lowercase,
    Capitalize,
};

enum class TextDecoration {
    None,
    Underline,
    LineThrough,
    Overline,
};

enum class WhiteSpace {
    Normal,
    NoWrap,
    Pre,
    PreWrap,
    PreLine,
};

} // namespace SC
