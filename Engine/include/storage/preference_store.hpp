#pragma once

#include <database/connection_pool.hpp>
#include <storage/repositories.hpp>

namespace Stonetrail {

class PgPreferenceStore final : public PreferenceRepository {
public:
    explicit PgPreferenceStore(ConnectionPool& pool);

    std::optional<UserPreference> find(UserId user) override;
    void save(const UserPreference& pref) override;

private:
    ConnectionPool& pool_;
};

} // namespace Stonetrail
