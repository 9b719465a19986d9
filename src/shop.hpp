#pragma once

#include "entities.hpp"

#include <string>
#include <vector>

// Fixed shop catalogue.
//
// Item ids are the potion's level-file marker ("S", "M", "F"), so the same
// token names a potion on the map and on the price list. Bought potions are
// drunk on the spot; there is no inventory.
struct ShopItem {
    EntityKind kind;
    const char* id;
    const char* displayName;
    int price;
};

// In display order.
const std::vector<ShopItem>& shopCatalogue();

// Exact id match ("S"). Returns nullptr for unknown ids.
const ShopItem* findShopItem(const std::string& id);

// Lenient lookup for typed commands: id in either case, display name, or a
// unique prefix of the display name ("str", "fancy potion").
const ShopItem* resolveShopItem(const std::string& query);
