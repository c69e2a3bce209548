#pragma once

#include <slide_grid/layout_constants.hpp>
#include <slide_model/types.hpp>
#include <string>
#include <vector>

namespace slide_grid {

enum class ConnectionKind {
    Span,   // self-referential: block extends beyond 1x1, draw a highlight region
    Group   // consecutive members of an author-assigned group, in reading order
};

// Display-only relationship between blocks. Derived from the layout and never
// written back into it.
struct Connection {
    slide_model::BlockId from;
    slide_model::BlockId to;
    ConnectionKind kind = ConnectionKind::Span;
    std::string color = layout::span_connection_color;
};

inline bool operator==(const Connection& a, const Connection& b) {
    return a.from == b.from && a.to == b.to && a.kind == b.kind && a.color == b.color;
}

const char* connection_kind_name(ConnectionKind kind);

// One Span connection per block (block-list order) whose span exceeds 1x1.
std::vector<Connection> derive_span_connections(const slide_model::GridLayout& layout,
    const std::vector<slide_model::Block>& blocks);

// Chains each group's members in row-major order of their origins: k members give
// k-1 connections. Unpositioned members sort as if at (0,0).
std::vector<Connection> derive_group_connections(const slide_model::GridLayout& layout,
    const std::vector<slide_model::Block>& blocks);

// Span connections followed by group connections, recomputed from scratch.
std::vector<Connection> derive_connections(const slide_model::GridLayout& layout,
    const std::vector<slide_model::Block>& blocks);

} // namespace slide_grid
