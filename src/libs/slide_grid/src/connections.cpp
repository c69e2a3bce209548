#include <slide_grid/connections.hpp>
#include <slide_grid/geometry.hpp>
#include <algorithm>
#include <iterator>
#include <unordered_map>
#include <utility>

namespace slide_grid {

namespace {

struct GroupMember {
    slide_model::BlockId id;
    slide_model::GridPosition position; // (0,0) when unassigned, for sorting only
};

struct BlockGroup {
    std::string group_id;
    std::vector<GroupMember> members;
};

// Groups in order of first appearance of their id in the block list.
std::vector<BlockGroup> find_block_groups(const slide_model::GridLayout& layout,
    const std::vector<slide_model::Block>& blocks)
{
    std::vector<BlockGroup> groups;
    std::unordered_map<std::string, std::size_t> index;

    for (const auto& b : blocks) {
        if (b.group_id.empty()) continue;
        auto it = index.find(b.group_id);
        if (it == index.end()) {
            it = index.emplace(b.group_id, groups.size()).first;
            groups.push_back({ b.group_id, {} });
        }
        GroupMember m;
        m.id = b.id;
        auto pos = layout.positions.find(b.id);
        if (pos != layout.positions.end()) m.position = pos->second;
        groups[it->second].members.push_back(std::move(m));
    }
    return groups;
}

} // namespace

const char* connection_kind_name(ConnectionKind kind) {
    switch (kind) {
    case ConnectionKind::Span: return "span";
    case ConnectionKind::Group: return "group";
    }
    return "span";
}

std::vector<Connection> derive_span_connections(const slide_model::GridLayout& layout,
    const std::vector<slide_model::Block>& blocks)
{
    std::vector<Connection> out;
    for (const auto& b : blocks) {
        if (layout.spans.count(b.id) == 0) continue;
        const auto span = span_of(layout, b.id);
        if (span.row_span <= 1 && span.column_span <= 1) continue;

        Connection c;
        c.from = b.id;
        c.to = b.id;
        c.kind = ConnectionKind::Span;
        c.color = layout::span_connection_color;
        out.push_back(std::move(c));
    }
    return out;
}

std::vector<Connection> derive_group_connections(const slide_model::GridLayout& layout,
    const std::vector<slide_model::Block>& blocks)
{
    std::vector<Connection> out;
    for (auto& group : find_block_groups(layout, blocks)) {
        auto& members = group.members;
        if (members.size() < 2) continue;

        std::stable_sort(members.begin(), members.end(), [](const GroupMember& a, const GroupMember& b) {
            if (a.position.row != b.position.row) return a.position.row < b.position.row;
            return a.position.column < b.position.column;
        });

        for (std::size_t i = 0; i + 1 < members.size(); ++i) {
            Connection c;
            c.from = members[i].id;
            c.to = members[i + 1].id;
            c.kind = ConnectionKind::Group;
            c.color = layout::group_connection_color;
            out.push_back(std::move(c));
        }
    }
    return out;
}

std::vector<Connection> derive_connections(const slide_model::GridLayout& layout,
    const std::vector<slide_model::Block>& blocks)
{
    std::vector<Connection> lines = derive_span_connections(layout, blocks);
    std::vector<Connection> group_lines = derive_group_connections(layout, blocks);
    lines.insert(lines.end(), std::make_move_iterator(group_lines.begin()),
        std::make_move_iterator(group_lines.end()));
    return lines;
}

} // namespace slide_grid
