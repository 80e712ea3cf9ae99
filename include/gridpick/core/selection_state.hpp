#pragma once

#include "gridpick/core/grid_layout.hpp"
#include "gridpick/types.hpp"

#include <functional>
#include <optional>
#include <set>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace gridpick {

using SizeProvider = std::function<TerminalSize()>;

// All state of one picker session.
//
// Items are addressed by canonical index (position in the original list);
// the selection stores canonical indices. The cursor and viewport offset are
// positions in the filtered view.
class SelectionState {
public:
    SelectionState(std::vector<std::string> items, SizeProvider size_provider);

    // Seeding
    auto select_item(size_t index) -> void;
    auto preselect(std::span<const std::string> previous_selection) -> void;

    // Layout cache
    auto invalidate_layout() -> void;
    auto has_cached_layout() const -> bool { return cached_layout_.has_value(); }
    auto layout() -> GridLayout;
    // Layout for the next frame with the viewport moved onto the cursor's page
    auto prepare_frame() -> GridLayout;

    // Filtering
    auto set_query(std::string query, bool reset_position) -> void;

    // Search entry
    auto enter_search_mode() -> void;
    auto exit_search_mode() -> void;
    auto push_search_char(std::string_view ch) -> void;
    auto pop_search_char() -> void;
    auto clear_search() -> void;
    // True when the key was consumed by search handling
    auto handle_search_key(const KeyEvent& key) -> bool;

    // Navigation
    auto move_up() -> void;
    auto move_down() -> void;
    auto move_left() -> void;
    auto move_right() -> void;
    auto page_up() -> void;
    auto page_down() -> void;
    auto move_home() -> void;
    auto move_end() -> void;

    // Selection
    auto toggle_current() -> void;
    auto select_all() -> void;
    auto clear_all() -> void;

    auto items() const -> const std::vector<std::string>& { return items_; }
    auto filtered_indices() const -> const std::vector<size_t>& { return filtered_indices_; }
    auto selected_indices() const -> const std::set<size_t>& { return selected_; }
    auto cursor() const -> size_t { return cursor_; }
    auto viewport_offset() const -> size_t { return viewport_offset_; }
    auto search_query() const -> const std::string& { return search_query_; }
    auto search_active() const -> bool { return search_active_; }

    auto total_count() const -> size_t { return items_.size(); }
    auto visible_count() const -> size_t { return filtered_indices_.size(); }
    auto selected_count() const -> size_t { return selected_.size(); }
    auto is_selected(size_t index) const -> bool { return selected_.contains(index); }
    auto current_item_index() const -> std::optional<size_t>;
    auto filter_matches_full_list() const -> bool { return visible_count() == total_count(); }

    // Space, or the ideographic space some input methods send instead
    static auto is_toggle_key(const KeyEvent& key) -> bool;

    // Selected items in ascending canonical order. Consumes the state.
    auto finish() && -> std::vector<std::string>;

private:
    auto refresh_filter(bool reset_position) -> void;
    auto ensure_visible(const GridLayout& layout) -> void;
    auto widest_filtered_item() const -> size_t;

    static auto is_typable(const KeyEvent& key) -> bool;
    static auto is_reserved_hotkey(const KeyEvent& key) -> bool;

    std::vector<std::string> items_;
    std::vector<size_t> item_widths_;
    std::vector<size_t> filtered_indices_;
    std::set<size_t> selected_;
    size_t cursor_ = 0;
    size_t viewport_offset_ = 0;
    std::optional<GridLayout> cached_layout_;
    std::string search_query_;
    bool search_active_ = false;
    SizeProvider size_provider_;
};

} // namespace gridpick
