//
// Created by igor on 14/10/2026.
//

#include <menu_overlay/layout/menu_content.hh>
#include <algorithm>

namespace menu_overlay {

    std::size_t menu_content::item_count() const {
        std::size_t n = 0;
        for (const auto& s : sections) {
            n += s.items.size();
        }
        return n;
    }

    std::size_t menu_content::described_item_count() const {
        std::size_t n = 0;
        for (const auto& s : sections) {
            n += static_cast<std::size_t>(std::count_if(s.items.begin(), s.items.end(), [](const menu_item& i) {
                return i.description && !i.description->empty();
            }));
        }
        return n;
    }

} // namespace menu_overlay
