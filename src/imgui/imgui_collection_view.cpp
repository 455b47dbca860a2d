#include "imgui_app.hpp"
#include "imgui.h"
#include <algorithm>

namespace lazylist {

static constexpr ImU32 kCardBackground = IM_COL32(34, 36, 40, 255);
static constexpr ImU32 kCardHovered = IM_COL32(46, 49, 56, 255);
static constexpr ImU32 kCardSelected = IM_COL32(38, 74, 118, 255);
static constexpr ImU32 kCardFallbackBorder = IM_COL32(200, 64, 64, 255);
static constexpr ImU32 kTitleColor = IM_COL32(235, 235, 235, 255);
static constexpr ImU32 kMetaColor = IM_COL32(230, 190, 90, 255);
static constexpr ImU32 kDescriptionColor = IM_COL32(190, 190, 190, 255);
static constexpr ImU32 kTagColor = IM_COL32(110, 200, 120, 255);
static constexpr ImU32 kFallbackColor = IM_COL32(235, 110, 110, 255);

void ImGuiApp::render_collection() {
    auto& loader = browser_->loader();
    auto& collection = view_model_.collection;
    const auto& config = loader.config();

    const float scroll_y = ImGui::GetScrollY();
    const float view_height = ImGui::GetWindowHeight();

    // Report scroll and size changes; the loader coalesces them per frame
    const float correction = browser_->take_scroll_correction();
    if (scroll_to_top_) {
        scroll_to_top_ = false;
        ImGui::SetScrollY(0.0f);
        loader.on_scroll(0.0f);
        last_scroll_y_ = 0.0f;
    } else if (correction > 0.0f) {
        // Head was evicted: keep the same cards under the viewport
        const float corrected = std::max(0.0f, scroll_y - correction);
        ImGui::SetScrollY(corrected);
        loader.on_scroll(corrected);
        last_scroll_y_ = corrected;
    } else if (scroll_y != last_scroll_y_) {
        loader.on_scroll(scroll_y);
        last_scroll_y_ = scroll_y;
    }
    if (view_height != last_view_height_) {
        loader.on_resize(view_height);
        last_view_height_ = view_height;
    }
    loader.on_frame();

    if (browser_->show_empty_state()) {
        const char* message = "No configurations found";
        const ImVec2 text_size = ImGui::CalcTextSize(message);
        const ImVec2 avail = ImGui::GetContentRegionAvail();
        ImGui::SetCursorPos(ImVec2((avail.x - text_size.x) * 0.5f, (avail.y - text_size.y) * 0.5f));
        ImGui::TextDisabled("%s", message);
        return;
    }

    // Keep the keyboard selection in view
    if (collection.scroll_to_selected) {
        collection.scroll_to_selected = false;
        const size_t selected = collection.selected_absolute;
        if (selected != kNoSelection && selected >= loader.evicted_count()) {
            const size_t index = selected - loader.evicted_count();
            const float top = static_cast<float>(index / static_cast<size_t>(config.items_per_row)) *
                              config.item_height_estimate;
            const float bottom = top + config.item_height_estimate;
            if (top < last_scroll_y_) {
                ImGui::SetScrollY(top);
            } else if (bottom > last_scroll_y_ + view_height) {
                ImGui::SetScrollY(bottom - view_height);
            }
        }
    }

    const ContentRenderPlan plan = browser_->render();
    const float width = ImGui::GetContentRegionAvail().x;
    const float column_width = width / static_cast<float>(config.items_per_row);

    // Cards tile exactly: spacers + rows add up to the full content height
    ImGui::PushStyleVar(ImGuiStyleVar_ItemSpacing, ImVec2(0.0f, 0.0f));
    if (plan.top_padding > 0.0f) {
        ImGui::Dummy(ImVec2(width, plan.top_padding));
    }
    for (const auto& item : plan.items) {
        const size_t column = item.index % static_cast<size_t>(config.items_per_row);
        if (column > 0) {
            ImGui::SameLine(static_cast<float>(column) * column_width);
        }
        render_card(item, ImVec2(column_width, config.item_height_estimate));
    }
    if (plan.bottom_padding > 0.0f) {
        ImGui::Dummy(ImVec2(width, plan.bottom_padding));
    }
    ImGui::PopStyleVar();

    render_list_footer();

    // Sentinel sits right below the last card
    browser_->update_sentinel(ImGui::GetScrollY(), view_height);
}

void ImGuiApp::render_card(const RenderedItem<ItemCard>& item, const ImVec2& size) {
    const ItemCard& card = item.output;
    auto& collection = view_model_.collection;

    ImGui::PushID(item.key.c_str());
    const ImVec2 pos = ImGui::GetCursorScreenPos();
    if (ImGui::InvisibleButton("card", size)) {
        collection.selected_absolute = item.absolute_index;
    }
    const bool hovered = ImGui::IsItemHovered();
    const bool selected = item.absolute_index == collection.selected_absolute;

    ImDrawList* draw_list = ImGui::GetWindowDrawList();
    const ImVec2 min(pos.x + 4.0f, pos.y + 4.0f);
    const ImVec2 max(pos.x + size.x - 4.0f, pos.y + size.y - 4.0f);

    const ImU32 background = selected ? kCardSelected : (hovered ? kCardHovered : kCardBackground);
    draw_list->AddRectFilled(min, max, background, 4.0f);
    if (card.fallback) {
        draw_list->AddRect(min, max, kCardFallbackBorder, 4.0f);
    }

    const float line = ImGui::GetTextLineHeight();
    const ImVec2 text(min.x + 8.0f, min.y + 4.0f);

    draw_list->PushClipRect(min, max, true);
    draw_list->AddText(text, card.fallback ? kFallbackColor : kTitleColor, card.title.c_str());
    draw_list->AddText(ImVec2(text.x, text.y + line), card.fallback ? kFallbackColor : kMetaColor,
                       card.meta.c_str());
    draw_list->AddText(ImVec2(text.x, text.y + 2.0f * line), kDescriptionColor, card.description.c_str());
    draw_list->AddText(ImVec2(text.x, text.y + 3.0f * line), kTagColor, card.tags.c_str());
    draw_list->PopClipRect();

    if (hovered && card.fallback) {
        ImGui::SetTooltip("This item could not be rendered:\n%s", card.description.c_str());
    }
    ImGui::PopID();
}

void ImGuiApp::render_list_footer() {
    auto& loader = browser_->loader();
    const auto& status = view_model_.status_bar;

    ImGui::Spacing();
    switch (loader.phase()) {
        case LoadPhase::Loading:
            ImGui::TextDisabled("Loading more...");
            break;

        case LoadPhase::Error:
            ImGui::PushStyleColor(ImGuiCol_Text, ImVec4(1.0f, 0.4f, 0.4f, 1.0f));
            ImGui::TextUnformatted(loader.error_message().c_str());
            ImGui::PopStyleColor();
            ImGui::SameLine();
            if (ImGui::Button("Retry")) {
                loader.retry();
            }
            break;

        case LoadPhase::Idle:
            if (loader.has_more()) {
                if (ImGui::Button("Load more")) {
                    loader.load_more();
                }
            } else if (status.retained_count > 0) {
                ImGui::TextDisabled("End of list");
            }
            break;
    }
}

} // namespace lazylist
