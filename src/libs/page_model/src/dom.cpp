#include <page_model/dom.hpp>
#include <cctype>
#include <set>
#include <sstream>

namespace page_model {

namespace {

const std::set<std::string> void_elements = {
    "area", "base", "br", "col", "embed", "hr", "img", "input",
    "link", "meta", "source", "track", "wbr"
};

void escape_into(std::string& out, const std::string& s, bool in_attribute) {
    for (char c : s) {
        switch (c) {
        case '&': out += "&amp;"; break;
        case '<': out += "&lt;"; break;
        case '>': out += "&gt;"; break;
        case '"':
            if (in_attribute) out += "&quot;";
            else out += c;
            break;
        default: out += c; break;
        }
    }
}

void collect_text(const DomNode& node, std::string& out) {
    if (node.is_text()) {
        out += node.text;
        return;
    }
    out += node.text;
    for (const auto& child : node.children)
        collect_text(child, out);
}

void serialize_into(const DomNode& node, std::string& out) {
    if (node.is_text()) {
        escape_into(out, node.text, false);
        return;
    }
    out += '<';
    out += node.tag_name;
    for (const auto& [name, value] : node.attributes) {
        out += ' ';
        out += name;
        out += "=\"";
        escape_into(out, value, true);
        out += '"';
    }
    out += '>';
    if (void_elements.count(node.tag_name)) return;

    // script/style bodies are raw text
    if (node.tag_name == "script" || node.tag_name == "style") out += node.text;
    else escape_into(out, node.text, false);
    for (const auto& child : node.children)
        serialize_into(child, out);
    out += "</";
    out += node.tag_name;
    out += '>';
}

} // namespace

std::string text_content(const DomNode& node) {
    std::string raw;
    collect_text(node, raw);

    std::string out;
    bool pending_space = false;
    for (char c : raw) {
        if (std::isspace(static_cast<unsigned char>(c))) {
            pending_space = !out.empty();
            continue;
        }
        if (pending_space) out += ' ';
        pending_space = false;
        out += c;
    }
    return out;
}

std::string serialize_outer_html(const DomNode& node) {
    std::string out;
    serialize_into(node, out);
    return out;
}

std::string serialize_inner_html(const DomNode& node) {
    std::string out;
    if (node.tag_name == "script" || node.tag_name == "style") out += node.text;
    else escape_into(out, node.text, false);
    for (const auto& child : node.children)
        serialize_into(child, out);
    return out;
}

std::vector<std::string> class_list(const DomNode& node) {
    std::vector<std::string> out;
    auto it = node.attributes.find("class");
    if (it == node.attributes.end()) return out;
    std::istringstream in(it->second);
    std::string cls;
    while (in >> cls)
        out.push_back(cls);
    return out;
}

std::string attribute_or(const DomNode& node, const std::string& name, const std::string& fallback) {
    auto it = node.attributes.find(name);
    return it != node.attributes.end() ? it->second : fallback;
}

DomNode make_element(std::string tag, std::map<std::string, std::string> attributes,
    std::vector<DomNode> children)
{
    DomNode n;
    n.tag_name = std::move(tag);
    n.attributes = std::move(attributes);
    n.children = std::move(children);
    return n;
}

DomNode make_text(std::string text) {
    DomNode n;
    n.tag_name = text_tag;
    n.text = std::move(text);
    return n;
}

} // namespace page_model
