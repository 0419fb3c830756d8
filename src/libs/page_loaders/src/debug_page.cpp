#include <page_loaders/debug_page.hpp>

namespace page_loaders {

page_model::DomDocument generate_debug_page() {
    using page_model::DomNode;
    using page_model::make_element;
    using page_model::make_text;

    page_model::DomDocument out;
    out.title = "Landing page (debug)";

    auto styled = [](DomNode node, std::initializer_list<std::pair<const char*, const char*>> styles) {
        for (const auto& [k, v] : styles)
            node.computed_style[k] = v;
        return node;
    };
    auto text_el = [&](const char* tag, const char* text,
        std::initializer_list<std::pair<const char*, const char*>> styles = {},
        std::map<std::string, std::string> attrs = {})
    {
        return styled(make_element(tag, std::move(attrs), { make_text(text) }), styles);
    };
    auto link = [&](const char* href, const char* text) {
        return make_element("a", { { "href", href } }, { make_text(text) });
    };
    auto card = [&](const char* img, const char* title, const char* body) {
        return styled(make_element("div", { { "class", "col-md-4" } }, {
            styled(make_element("div", { { "class", "card" } }, {
                make_element("img", { { "src", img }, { "alt", title } }),
                text_el("h3", title, { { "font-size", "24px" }, { "font-weight", "600" }, { "font-family", "\"Poppins\", sans-serif" } }),
                text_el("p", body, { { "font-size", "16px" }, { "font-family", "Inter, sans-serif" }, { "color", "rgb(51, 51, 51)" } }),
            }), { { "background-color", "#ffffff" }, { "border-radius", "8px" }, { "padding", "24px" } }),
        }), { { "width", "33.3333%" } });
    };

    DomNode header = make_element("header", { { "class", "site-header" } }, {
        make_element("nav", { { "class", "main-nav" } }, {
            make_element("ul", { { "class", "menu" } }, {
                make_element("li", {}, { link("/", "Home") }),
                make_element("li", {}, { link("/pricing", "Pricing") }),
                make_element("li", {}, { link("/contact", "Contact") }),
            }),
        }),
    });
    header = styled(std::move(header), { { "background-color", "rgb(17, 24, 39)" }, { "padding", "16px 32px" } });

    DomNode hero = make_element("section", { { "class", "hero" } }, {
        text_el("h1", "Ship pages faster", { { "font-size", "48px" }, { "font-weight", "700" }, { "font-family", "\"Poppins\", sans-serif" }, { "color", "#ffffff" } }),
        text_el("p", "Clone any landing page into your favourite builder.", { { "font-size", "20px" }, { "font-family", "Inter, sans-serif" } }),
        styled(make_element("a", { { "class", "btn btn-primary" }, { "href", "/signup" } }, { make_text("Get started") }),
            { { "background-color", "rgb(37, 99, 235)" }, { "color", "#ffffff" }, { "padding", "12px 24px" },
              { "border-radius", "6px" }, { "display", "inline-block" }, { "cursor", "pointer" }, { "font-size", "16px" } }),
    });
    hero = styled(std::move(hero), { { "background-color", "rgb(30, 64, 175)" }, { "padding", "96px 32px" }, { "min-height", "480px" } });

    DomNode features = make_element("section", { { "class", "features" } }, {
        text_el("h2", "Why teams switch", { { "font-size", "36px" }, { "font-weight", "700" }, { "font-family", "\"Poppins\", sans-serif" } }),
        make_element("div", { { "class", "row" } }, {
            card("/img/speed.png", "Fast", "Recognition runs in milliseconds."),
            card("/img/native.png", "Native", "Every widget lands as a native element."),
            card("/img/safe.png", "Safe", "Anything unknown is kept as HTML."),
        }),
    });

    DomNode faq = make_element("section", { { "class", "faq" } }, {
        text_el("h2", "Questions", { { "font-size", "36px" }, { "font-weight", "700" } }),
        make_element("div", { { "class", "accordion" } }, {
            make_element("div", { { "class", "accordion-item" } }, {
                make_element("button", { { "class", "accordion-header" }, { "aria-expanded", "true" } }, { make_text("Which builders are supported?") }),
                make_element("div", { { "class", "accordion-body" } }, { make_text("Elementor, Gutenberg, Beaver Builder, Divi, Bricks and Oxygen.") }),
            }),
            make_element("div", { { "class", "accordion-item" } }, {
                make_element("button", { { "class", "accordion-header" }, { "aria-expanded", "false" } }, { make_text("Is custom code kept?") }),
                make_element("div", { { "class", "accordion-body" } }, { make_text("Scripts are flagged and embedded as HTML.") }),
            }),
        }),
        make_element("blockquote", { { "class", "testimonial" } }, {
            make_element("p", {}, { make_text("We moved forty pages in an afternoon.") }),
            make_element("cite", {}, { make_text("Dana, agency lead") }),
        }),
    });

    DomNode contact = make_element("section", { { "class", "contact" } }, {
        make_element("form", { { "action", "/contact" }, { "method", "post" } }, {
            make_element("input", { { "type", "email" }, { "name", "email" }, { "placeholder", "you@example.com" }, { "required", "" } }),
            make_element("textarea", { { "name", "message" }, { "placeholder", "Message" } }),
            make_element("button", { { "type", "submit" } }, { make_text("Send") }),
        }),
        make_element("marquee", {}, { make_text("Limited offer!") }),
    });

    DomNode footer = make_element("footer", { { "class", "site-footer" } }, {
        text_el("p", "(c) 2026 Example Inc.", { { "font-size", "14px" }, { "color", "#6b7280" } }),
    });

    out.root = make_element("body", {}, {
        std::move(header), std::move(hero), std::move(features), std::move(faq),
        std::move(contact), std::move(footer),
    });
    out.root.computed_style["font-family"] = "Inter, sans-serif";
    out.root.computed_style["font-size"] = "16px";
    return out;
}

} // namespace page_loaders
