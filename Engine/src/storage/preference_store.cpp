#include <storage/preference_store.hpp>

namespace Stonetrail {

PgPreferenceStore::PgPreferenceStore(ConnectionPool& pool) : pool_(pool) {}

std::optional<UserPreference> PgPreferenceStore::find(UserId user) {
    auto db = pool_.acquire();
    auto lang = db->query_single(
        "SELECT language FROM stonetrail.user_preferences WHERE user_id = $1",
        {std::to_string(user)});
    if (!lang) return std::nullopt;
    return UserPreference{user, *lang};
}

void PgPreferenceStore::save(const UserPreference& pref) {
    auto db = pool_.acquire();
    db->execute(
        "INSERT INTO stonetrail.user_preferences (user_id, language, updated_at) "
        "VALUES ($1, $2, now()) "
        "ON CONFLICT (user_id) DO UPDATE SET language = EXCLUDED.language, updated_at = now()",
        {std::to_string(pref.user_id), pref.language});
}

} // namespace Stonetrail
