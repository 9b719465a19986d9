#include "shop.hpp"

#include "common.hpp"

const std::vector<ShopItem>& shopCatalogue() {
    static const std::vector<ShopItem> items = {
        { EntityKind::StrengthPotion, "S", "Strength Potion", 5 },
        { EntityKind::MovePotion,     "M", "Move Potion",     5 },
        { EntityKind::FancyPotion,    "F", "Fancy Potion",    10 },
    };
    return items;
}

const ShopItem* findShopItem(const std::string& id) {
    for (const auto& it : shopCatalogue()) {
        if (id == it.id) return &it;
    }
    return nullptr;
}

const ShopItem* resolveShopItem(const std::string& queryIn) {
    const std::string query = toLower(trim(queryIn));
    if (query.empty()) return nullptr;

    const ShopItem* prefixMatch = nullptr;
    int prefixCount = 0;
    for (const auto& it : shopCatalogue()) {
        const std::string id = toLower(it.id);
        const std::string name = toLower(it.displayName);
        if (query == id || query == name) return &it;
        if (name.rfind(query, 0) == 0) {
            prefixMatch = &it;
            ++prefixCount;
        }
    }
    return prefixCount == 1 ? prefixMatch : nullptr;
}
