#include <hcl_writer/hcl.hpp>
#include <algorithm>
#include <cctype>

namespace hcl_writer {

namespace {

void write_indent(std::string& out, int indent) {
    out.append(static_cast<std::size_t>(indent), ' ');
}

std::string render_key(const std::string& key) {
    return is_identifier(key) ? key : quote(key);
}

std::string join_list(const std::vector<std::string>& rendered) {
    std::string out = "[";
    for (std::size_t i = 0; i < rendered.size(); ++i) {
        if (i > 0) out += ", ";
        out += rendered[i];
    }
    out += "]";
    return out;
}

void write_aligned(std::string& out, int indent, const std::string& key, std::size_t width,
    const std::string& value)
{
    write_indent(out, indent);
    out += key;
    out.append(width > key.size() ? width - key.size() : 0, ' ');
    out += " = ";
    out += value;
    out += '\n';
}

} // namespace

std::string quote(const std::string& value) {
    std::string out;
    out.reserve(value.size() + 2);
    out += '"';
    for (std::size_t i = 0; i < value.size(); ++i) {
        const char c = value[i];
        switch (c) {
        case '"': out += "\\\""; break;
        case '\\': out += "\\\\"; break;
        case '\n': out += "\\n"; break;
        case '\r': out += "\\r"; break;
        case '\t': out += "\\t"; break;
        case '$':
        case '%':
            out += c;
            // Template introducers "${" / "%{" must be doubled to stay literal.
            if (i + 1 < value.size() && value[i + 1] == '{') out += c;
            break;
        default: out += c; break;
        }
    }
    out += '"';
    return out;
}

bool is_identifier(const std::string& s) {
    if (s.empty()) return false;
    const auto first = static_cast<unsigned char>(s[0]);
    if (!std::isalpha(first) && s[0] != '_') return false;
    return std::all_of(s.begin(), s.end(), [](char ch) {
        const auto c = static_cast<unsigned char>(ch);
        return std::isalnum(c) || ch == '_' || ch == '-';
    });
}

std::string sanitize_name(const std::string& id) {
    std::string out = id;
    std::replace(out.begin(), out.end(), '-', '_');
    return out;
}

Body::Body() = default;
Body::~Body() = default;
Body::Body(Body&&) noexcept = default;
Body& Body::operator=(Body&&) noexcept = default;

void Body::set_inline(const std::string& name, std::string rendered) {
    Item item;
    item.kind = Item::Kind::Attribute;
    item.name = name;
    item.inline_value = std::move(rendered);
    items_.push_back(std::move(item));
}

void Body::set_string(const std::string& name, const std::string& value) {
    set_inline(name, quote(value));
}

void Body::set_string_if_not_empty(const std::string& name, const std::string& value) {
    if (!value.empty()) set_string(name, value);
}

void Body::set_bool(const std::string& name, bool value) {
    set_inline(name, value ? "true" : "false");
}

void Body::set_int(const std::string& name, std::int64_t value) {
    set_inline(name, std::to_string(value));
}

void Body::set_traversal(const std::string& name, const std::string& expression) {
    set_inline(name, expression);
}

void Body::set_string_list(const std::string& name, const std::vector<std::string>& values) {
    std::vector<std::string> rendered;
    rendered.reserve(values.size());
    for (const auto& v : values)
        rendered.push_back(quote(v));
    set_inline(name, join_list(rendered));
}

void Body::set_traversal_list(const std::string& name, const std::vector<std::string>& expressions) {
    set_inline(name, join_list(expressions));
}

void Body::set_string_map(const std::string& name, const std::map<std::string, std::string>& values) {
    if (values.empty()) return;
    Item item;
    item.kind = Item::Kind::Attribute;
    item.name = name;
    item.is_object = true;
    for (const auto& [k, v] : values)
        item.object_entries.emplace_back(render_key(k), quote(v));
    items_.push_back(std::move(item));
}

Block& Body::append_block(const std::string& type, std::vector<std::string> labels) {
    Item item;
    item.kind = Item::Kind::Block;
    item.block = std::make_unique<Block>(type, std::move(labels));
    items_.push_back(std::move(item));
    return *items_.back().block;
}

void Body::append_newline() {
    Item item;
    item.kind = Item::Kind::Newline;
    items_.push_back(std::move(item));
}

void Body::render(std::string& out, int indent) const {
    std::size_t i = 0;
    while (i < items_.size()) {
        const Item& item = items_[i];
        if (item.kind == Item::Kind::Newline) {
            out += '\n';
            ++i;
            continue;
        }
        if (item.kind == Item::Kind::Block) {
            item.block->render(out, indent);
            ++i;
            continue;
        }

        // Alignment run: consecutive attributes, closed after the first
        // multi-line one (its closing brace breaks the column).
        std::size_t end = i;
        std::size_t width = 0;
        while (end < items_.size() && items_[end].kind == Item::Kind::Attribute) {
            width = std::max(width, items_[end].name.size());
            ++end;
            if (items_[end - 1].is_object) break;
        }

        for (std::size_t k = i; k < end; ++k) {
            const Item& attr = items_[k];
            if (!attr.is_object) {
                write_aligned(out, indent, attr.name, width, attr.inline_value);
                continue;
            }
            write_aligned(out, indent, attr.name, width, "{");
            std::size_t key_width = 0;
            for (const auto& entry : attr.object_entries)
                key_width = std::max(key_width, entry.first.size());
            for (const auto& entry : attr.object_entries)
                write_aligned(out, indent + 2, entry.first, key_width, entry.second);
            write_indent(out, indent);
            out += "}\n";
        }
        i = end;
    }
}

Block::Block(std::string type, std::vector<std::string> labels)
    : type_(std::move(type)), labels_(std::move(labels))
{
}

void Block::render(std::string& out, int indent) const {
    write_indent(out, indent);
    out += type_;
    for (const auto& label : labels_) {
        out += ' ';
        out += quote(label);
    }
    out += " {\n";
    body_.render(out, indent + 2);
    write_indent(out, indent);
    out += "}\n";
}

std::string File::bytes() const {
    std::string out;
    body_.render(out, 0);
    return out;
}

} // namespace hcl_writer
