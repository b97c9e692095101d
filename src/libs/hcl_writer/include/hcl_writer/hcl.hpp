#pragma once

#include <cstdint>
#include <map>
#include <memory>
#include <string>
#include <utility>
#include <vector>

namespace hcl_writer {

class Block;

// Ordered list of attributes and nested blocks, rendered in insertion order.
// Consecutive attributes have their '=' aligned the way `terraform fmt` does.
class Body {
public:
    Body();
    ~Body();
    Body(Body&&) noexcept;
    Body& operator=(Body&&) noexcept;

    void set_string(const std::string& name, const std::string& value);
    // No-op for an empty value.
    void set_string_if_not_empty(const std::string& name, const std::string& value);
    void set_bool(const std::string& name, bool value);
    void set_int(const std::string& name, std::int64_t value);
    // Unquoted expression, e.g. "aws_vpc.main.id" or "var.aws_region".
    void set_traversal(const std::string& name, const std::string& expression);
    void set_string_list(const std::string& name, const std::vector<std::string>& values);
    void set_traversal_list(const std::string& name, const std::vector<std::string>& expressions);
    // Rendered as a multi-line object; keys in map order. No-op when empty.
    void set_string_map(const std::string& name, const std::map<std::string, std::string>& values);

    Block& append_block(const std::string& type, std::vector<std::string> labels = {});
    void append_newline();

    bool empty() const { return items_.empty(); }
    void render(std::string& out, int indent) const;

private:
    struct Item {
        enum class Kind { Attribute, Block, Newline };
        Kind kind = Kind::Attribute;
        std::string name;
        std::string inline_value;
        // Multi-line object attribute: key -> rendered value.
        std::vector<std::pair<std::string, std::string>> object_entries;
        bool is_object = false;
        std::unique_ptr<Block> block;
    };

    void set_inline(const std::string& name, std::string rendered);

    std::vector<Item> items_;
};

class Block {
public:
    Block(std::string type, std::vector<std::string> labels);

    Body& body() { return body_; }
    const Body& body() const { return body_; }
    void render(std::string& out, int indent) const;

private:
    std::string type_;
    std::vector<std::string> labels_;
    Body body_;
};

class File {
public:
    Body& body() { return body_; }
    std::string bytes() const;

private:
    Body body_;
};

// HCL string literal with quotes and escapes ("${" is escaped to "$${").
std::string quote(const std::string& value);
// True when s can be written as a bare identifier (object keys, block types).
bool is_identifier(const std::string& s);
// Resource-name-safe form of a node id: every '-' becomes '_'.
std::string sanitize_name(const std::string& id);

} // namespace hcl_writer
