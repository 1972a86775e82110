#include <batchstore/core/records/category.hpp>

namespace BatchStore {

const char* toString(Category c) {
    switch (c) {
        case Category::MESSAGE:       return "messages";
        case Category::CONSUMPTION:   return "consumptions";
        case Category::SUBSCRIPTION:  return "subscriptions";
        default:                      return "unknown";
    }
}

CategorySpec defaultCategorySpec(Category c) {
    switch (c) {
        case Category::MESSAGE:
            return {"messages",
                    "INSERT INTO messages (topic, message_id, message, producer, timestamp) "
                    "VALUES (?, ?, ?, ?, ?)",
                    5};
        case Category::CONSUMPTION:
            return {"consumptions",
                    "INSERT INTO consumptions (consumer, topic, message_id, message, timestamp) "
                    "VALUES (?, ?, ?, ?, ?)",
                    5};
        case Category::SUBSCRIPTION:
            return {"subscriptions",
                    "INSERT OR REPLACE INTO subscriptions (sid, consumer, topic, connected_at) "
                    "VALUES (?, ?, ?, ?)",
                    4};
    }
    return {};
}

CategorySpecs defaultCategorySpecs() {
    CategorySpecs specs;
    for (auto c : ALL_CATEGORIES) {
        specs[categoryIndex(c)] = defaultCategorySpec(c);
    }
    return specs;
}

} // namespace BatchStore
