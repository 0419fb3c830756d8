#include <page_export/theme_template.hpp>
#include <string>

namespace page_export {

using nlohmann::json;

namespace {

json part_summary(const page_analysis::TemplatePart& part) {
    return { { "type", std::string(page_analysis::to_string(part.kind)) }, { "name", part.name }, { "elementId", part.element_id },
        { "confidence", part.confidence }, { "recurring", part.recurring }, { "pageIds", part.page_ids },
        { "position", { { "top", part.position.top }, { "bottom", part.position.bottom },
                          { "sticky", part.position.sticky } } },
        { "template", theme_template_json(part) } };
}

} // namespace

json theme_template_json(const page_analysis::TemplatePart& part) {
    const std::string type(page_analysis::to_string(part.kind));
    json widget = { { "id", type + "_html" }, { "elType", "widget" }, { "widgetType", "html" },
        { "settings", { { "html", part.html } } }, { "elements", json::array() } };
    json column = { { "id", type + "_column" }, { "elType", "column" }, { "settings", { { "_column_size", 100 } } },
        { "elements", json::array({ widget }) } };
    json section = { { "id", "template_" + type }, { "elType", "section" },
        { "settings", { { "layout", part.kind == page_analysis::TemplatePartKind::Header ? "full_width" : "boxed" } } },
        { "elements", json::array({ column }) } };

    json conditions = json::array();
    if (part.kind != page_analysis::TemplatePartKind::Sidebar)
        conditions.push_back({ { "type", "include" }, { "name", "general" }, { "sub_name", "entire_site" } });

    return { { "type", type }, { "title", part.name }, { "content", json::array({ section }) },
        { "conditions", conditions } };
}

json to_json(const page_analysis::TemplateParts& parts) {
    json out = json::object();
    if (parts.header) out["header"] = part_summary(*parts.header);
    if (parts.footer) out["footer"] = part_summary(*parts.footer);
    if (parts.sidebar) out["sidebar"] = part_summary(*parts.sidebar);
    const auto& s = parts.statistics;
    out["statistics"] = { { "hasHeader", s.has_header }, { "hasFooter", s.has_footer }, { "hasSidebar", s.has_sidebar },
        { "headerPages", s.header_pages }, { "footerPages", s.footer_pages }, { "sidebarPages", s.sidebar_pages },
        { "consistency", s.consistency } };
    return out;
}

} // namespace page_export
