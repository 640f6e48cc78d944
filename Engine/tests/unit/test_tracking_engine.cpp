/**
 * @file test_tracking_engine.cpp
 * @brief Conversation scenarios through the engine facade
 */

#include "../support/engine_fixture.hpp"

using namespace Stonetrail;
using namespace Stonetrail::testing;

namespace {

constexpr UserId kUser = 42;

class TrackingEngineTest : public EngineFixture {};

} // namespace

TEST_F(TrackingEngineTest, RegistersNewItemEndToEnd) {
    embedder_.set_image("ladybug.jpg", axis(kDims, 3));
    geocoder_.address = Address{"30-001", "Kraków", "Polska", "Rynek Główny, Kraków"};

    Reply r = engine_->handle_photo(kUser, photo("ladybug.jpg"));
    EXPECT_EQ(r.kind, ReplyKind::Prompt);
    EXPECT_EQ(r.code, ReplyCode::EnterName);
    EXPECT_EQ(r.state, SessionState::AwaitingName);
    ASSERT_TRUE(r.subject_found.has_value());
    EXPECT_FALSE(*r.subject_found);
    EXPECT_EQ(text(r.thumbnail), "thumb:ladybug.jpg");

    r = engine_->handle_text(kUser, "  Ladybug ");
    EXPECT_EQ(r.code, ReplyCode::EnterDescription);
    EXPECT_EQ(r.state, SessionState::AwaitingDescription);
    EXPECT_EQ(r.pending_name, "Ladybug");

    r = engine_->handle_text(kUser, "red with dots");
    EXPECT_EQ(r.code, ReplyCode::EnterLocation);
    EXPECT_EQ(r.state, SessionState::AwaitingLocation);

    r = engine_->handle_location(kUser, LocationInput::coordinates(50.06, 19.94));
    EXPECT_EQ(r.kind, ReplyKind::Confirmation);
    EXPECT_EQ(r.code, ReplyCode::ItemRegistered);
    EXPECT_EQ(r.state, SessionState::Idle);
    ASSERT_TRUE(r.item.has_value());
    EXPECT_EQ(r.item->name, "Ladybug");
    EXPECT_EQ(r.item->description, "red with dots");
    EXPECT_EQ(r.item->registered_by, kUser);
    EXPECT_EQ(r.item->history_count, 1u);
    ASSERT_TRUE(r.record.has_value());
    ASSERT_TRUE(r.record->location.has_value());
    EXPECT_DOUBLE_EQ(r.record->location->latitude, 50.06);
    EXPECT_EQ(r.record->postal_code, "30-001");
    EXPECT_EQ(r.record->photo_ref, "file:ladybug.jpg");
    ASSERT_TRUE(r.address.has_value());
    EXPECT_EQ(r.address->city, "Kraków");

    EXPECT_EQ(engine_->index().size(), 1u);
    EXPECT_EQ(engine_->session_state(kUser), SessionState::Idle);

    auto stored = items_.find(r.item->id);
    ASSERT_TRUE(stored.has_value());
    EXPECT_EQ(stored->embedding, axis(kDims, 3));
}

TEST_F(TrackingEngineTest, RecordsSightingOfExistingItemByPostalCode) {
    ItemId target = 0;
    for (std::size_t i = 1; i <= 7; ++i) {
        target = seed_item("stone " + std::to_string(i), axis(kDims, i));
    }
    ASSERT_EQ(target, 7);

    Embedding e(kDims, 0.0f);
    e[7] = 0.95f;
    e[0] = std::sqrt(1.0f - 0.95f * 0.95f);
    embedder_.set_image("found.jpg", e);
    geocoder_.postal["00-001"] = GeoPoint{52.23, 21.01};

    Reply r = engine_->handle_photo(kUser, photo("found.jpg"));
    EXPECT_EQ(r.code, ReplyCode::ExistingItemFound);
    EXPECT_EQ(r.state, SessionState::AwaitingConfirmation);
    ASSERT_TRUE(r.item.has_value());
    EXPECT_EQ(r.item->id, 7);
    EXPECT_EQ(r.item->history_count, 1u);
    ASSERT_TRUE(r.similarity.has_value());
    EXPECT_NEAR(*r.similarity, 0.95f, 1e-4f);

    r = engine_->handle_text(kUser, "00-001");
    EXPECT_EQ(r.code, ReplyCode::SightingRecorded);
    EXPECT_EQ(r.state, SessionState::Idle);
    ASSERT_TRUE(r.record.has_value());
    EXPECT_EQ(r.record->item_id, 7);
    ASSERT_TRUE(r.record->location.has_value());
    EXPECT_DOUBLE_EQ(r.record->location->latitude, 52.23);
    EXPECT_DOUBLE_EQ(r.record->location->longitude, 21.01);
    EXPECT_EQ(r.record->postal_code, "00-001");
    EXPECT_EQ(r.item->history_count, 2u);

    // The seed record has no coordinates, so the route is this sighting alone
    ASSERT_TRUE(r.route.has_value());
    ASSERT_EQ(r.route->points.size(), 1u);
    EXPECT_EQ(r.route->points[0].role, MarkerRole::Start);
    EXPECT_EQ(renderer_.calls, 1);
    EXPECT_EQ(text(r.route_image), "png:1");

    // Existing item's canonical embedding is untouched
    EXPECT_EQ(items_.find(7)->embedding, axis(kDims, 7));
    EXPECT_EQ(engine_->index().size(), 7u);
}

TEST_F(TrackingEngineTest, BelowThresholdStartsRegistration) {
    seed_item("rock", axis(kDims, 0));
    embedder_.set_image("other.jpg", near_axis0(0.81f));

    Reply r = engine_->handle_photo(kUser, photo("other.jpg"));
    EXPECT_EQ(r.code, ReplyCode::EnterName);
    EXPECT_FALSE(r.item.has_value());
}

TEST_F(TrackingEngineTest, AtOrAboveThresholdMatches) {
    ItemId id = seed_item("rock", axis(kDims, 0));
    embedder_.set_image("same.jpg", near_axis0(0.83f));

    Reply r = engine_->handle_photo(kUser, photo("same.jpg"));
    EXPECT_EQ(r.code, ReplyCode::ExistingItemFound);
    EXPECT_EQ(r.item->id, id);
}

TEST_F(TrackingEngineTest, CroppedSubjectIsEmbedded) {
    cropper_.detect = true;
    embedder_.set_image("crop:beetle.jpg", axis(kDims, 2));

    Reply r = engine_->handle_photo(kUser, photo("beetle.jpg"));
    EXPECT_EQ(r.code, ReplyCode::EnterName);
    EXPECT_TRUE(*r.subject_found);
}

TEST_F(TrackingEngineTest, ShortNameIsRejected) {
    embedder_.set_image("a.jpg", axis(kDims, 1));
    engine_->handle_photo(kUser, photo("a.jpg"));

    Reply r = engine_->handle_text(kUser, " A ");
    EXPECT_EQ(r.code, ReplyCode::NameTooShort);
    EXPECT_EQ(r.state, SessionState::AwaitingName);

    r = engine_->handle_text(kUser, "Żo");
    EXPECT_EQ(r.code, ReplyCode::EnterDescription);
}

TEST_F(TrackingEngineTest, SkippedDescriptionAndLocation) {
    embedder_.set_image("a.jpg", axis(kDims, 1));
    engine_->handle_photo(kUser, photo("a.jpg"));
    engine_->handle_text(kUser, "Pebble");

    Reply r = engine_->handle_skip(kUser);
    EXPECT_EQ(r.code, ReplyCode::EnterLocation);

    r = engine_->handle_skip(kUser);
    EXPECT_EQ(r.code, ReplyCode::ItemRegistered);
    EXPECT_FALSE(r.item->description.has_value());
    EXPECT_FALSE(r.record->location.has_value());
    EXPECT_FALSE(r.record->postal_code.has_value());
    EXPECT_EQ(geocoder_.forward_calls + geocoder_.reverse_calls, 0);
}

TEST_F(TrackingEngineTest, InvalidLocationKeepsState) {
    embedder_.set_image("a.jpg", axis(kDims, 1));
    engine_->handle_photo(kUser, photo("a.jpg"));
    engine_->handle_text(kUser, "Pebble");
    engine_->handle_skip(kUser);

    Reply r = engine_->handle_location(kUser, LocationInput::coordinates(91.0, 10.0));
    EXPECT_EQ(r.code, ReplyCode::InvalidLocation);
    EXPECT_EQ(r.state, SessionState::AwaitingLocation);

    r = engine_->handle_text(kUser, "somewhere near the lake!");
    EXPECT_EQ(r.code, ReplyCode::InvalidLocation);
    EXPECT_EQ(r.state, SessionState::AwaitingLocation);
    EXPECT_EQ(engine_->index().size(), 0u);
}

TEST_F(TrackingEngineTest, SkipWordIsNotStoredAsPostalCode) {
    embedder_.set_image("a.jpg", axis(kDims, 1));
    engine_->handle_photo(kUser, photo("a.jpg"));
    engine_->handle_text(kUser, "Pebble");
    engine_->handle_skip(kUser);

    for (const char* word : {"skip", "nie", "pomiń"}) {
        Reply r = engine_->handle_text(kUser, word);
        EXPECT_EQ(r.code, ReplyCode::InvalidLocation) << word;
        EXPECT_EQ(r.state, SessionState::AwaitingLocation) << word;
    }
    EXPECT_EQ(geocoder_.forward_calls, 0);
    EXPECT_TRUE(items_.list_all().empty());
}

TEST_F(TrackingEngineTest, UnknownPostalCodeStoredWithoutCoordinates) {
    embedder_.set_image("a.jpg", axis(kDims, 1));
    engine_->handle_photo(kUser, photo("a.jpg"));
    engine_->handle_text(kUser, "Pebble");
    engine_->handle_skip(kUser);

    Reply r = engine_->handle_location(kUser, LocationInput::postal("99-999"));
    EXPECT_EQ(r.code, ReplyCode::ItemRegistered);
    EXPECT_FALSE(r.record->location.has_value());
    EXPECT_EQ(r.record->postal_code, "99-999");
}

TEST_F(TrackingEngineTest, GeocoderOutageIsRetryable) {
    embedder_.set_image("a.jpg", axis(kDims, 1));
    engine_->handle_photo(kUser, photo("a.jpg"));
    engine_->handle_text(kUser, "Pebble");
    engine_->handle_skip(kUser);

    geocoder_.forward_unavailable = true;
    Reply r = engine_->handle_text(kUser, "00-001");
    EXPECT_TRUE(r.is_error());
    EXPECT_EQ(r.code, ReplyCode::RetryStep);
    EXPECT_EQ(r.failure, "geocoder");
    EXPECT_EQ(r.state, SessionState::AwaitingLocation);
    EXPECT_EQ(engine_->session_state(kUser), SessionState::AwaitingLocation);
    EXPECT_TRUE(items_.list_all().empty());

    geocoder_.forward_unavailable = false;
    geocoder_.postal["00-001"] = GeoPoint{52.23, 21.01};
    r = engine_->handle_text(kUser, "00-001");
    EXPECT_EQ(r.code, ReplyCode::ItemRegistered);
    EXPECT_EQ(r.item->name, "Pebble");
}

TEST_F(TrackingEngineTest, ReverseGeocodeFailureIsIgnored) {
    embedder_.set_image("a.jpg", axis(kDims, 1));
    engine_->handle_photo(kUser, photo("a.jpg"));
    engine_->handle_text(kUser, "Pebble");
    engine_->handle_skip(kUser);

    geocoder_.reverse_unavailable = true;
    Reply r = engine_->handle_location(kUser, LocationInput::coordinates(52.0, 21.0));
    EXPECT_EQ(r.code, ReplyCode::ItemRegistered);
    EXPECT_FALSE(r.address.has_value());
    EXPECT_TRUE(r.record->location.has_value());
}

TEST_F(TrackingEngineTest, EmbedderOutageLeavesNoSession) {
    embedder_.set_unavailable(true);
    Reply r = engine_->handle_photo(kUser, photo("a.jpg"));
    EXPECT_EQ(r.code, ReplyCode::RetryStep);
    EXPECT_EQ(r.failure, "embedding");
    EXPECT_EQ(r.state, SessionState::Idle);
    EXPECT_EQ(engine_->session_state(kUser), SessionState::Idle);
}

TEST_F(TrackingEngineTest, WrongEmbeddingDimensionIsCollaboratorFailure) {
    embedder_.set_image("a.jpg", Embedding(kDims + 1, 0.5f));
    Reply r = engine_->handle_photo(kUser, photo("a.jpg"));
    EXPECT_EQ(r.code, ReplyCode::RetryStep);
    EXPECT_EQ(r.failure, "embedding");
}

TEST_F(TrackingEngineTest, PersistenceFailureRollsBackCommit) {
    embedder_.set_image("a.jpg", axis(kDims, 1));
    engine_->handle_photo(kUser, photo("a.jpg"));
    engine_->handle_text(kUser, "Pebble");
    engine_->handle_skip(kUser);

    items_.set_unavailable(true);
    Reply r = engine_->handle_skip(kUser);
    EXPECT_EQ(r.code, ReplyCode::RetryStep);
    EXPECT_EQ(r.failure, "persistence");
    EXPECT_EQ(r.state, SessionState::AwaitingLocation);
    EXPECT_EQ(engine_->index().size(), 0u);

    items_.set_unavailable(false);
    r = engine_->handle_skip(kUser);
    EXPECT_EQ(r.code, ReplyCode::ItemRegistered);
    EXPECT_EQ(engine_->index().size(), 1u);
    EXPECT_EQ(history_.count_for_item(r.item->id), 1u);
}

TEST_F(TrackingEngineTest, FailedReadAfterSightingDoesNotDuplicateIt) {
    const ItemId id = seed_item("Ladybug", axis(kDims, 1));
    embedder_.set_image("again.jpg", axis(kDims, 1));

    Reply r = engine_->handle_photo(kUser, photo("again.jpg"));
    ASSERT_EQ(r.code, ReplyCode::ExistingItemFound);

    history_.fail_next_read();
    r = engine_->handle_location(kUser, LocationInput::coordinates(52.1, 21.0));
    EXPECT_EQ(r.code, ReplyCode::SightingRecorded);
    EXPECT_EQ(r.state, SessionState::Idle);
    ASSERT_TRUE(r.item.has_value());
    EXPECT_EQ(r.item->history_count, 2u);
    ASSERT_TRUE(r.item->latest_location.has_value());
    EXPECT_DOUBLE_EQ(r.item->latest_location->latitude, 52.1);
    EXPECT_FALSE(r.route.has_value());

    // A resent location finds no pending sighting
    r = engine_->handle_location(kUser, LocationInput::coordinates(52.1, 21.0));
    EXPECT_EQ(r.code, ReplyCode::SendPhoto);
    EXPECT_EQ(history_.count_for_item(id), 2u);
}

TEST_F(TrackingEngineTest, HistoryFailureRegistersNothing) {
    embedder_.set_image("a.jpg", axis(kDims, 1));
    engine_->handle_photo(kUser, photo("a.jpg"));
    engine_->handle_text(kUser, "Pebble");
    engine_->handle_skip(kUser);

    history_.set_unavailable(true);
    Reply r = engine_->handle_skip(kUser);
    EXPECT_EQ(r.code, ReplyCode::RetryStep);
    history_.set_unavailable(false);

    EXPECT_TRUE(items_.list_all().empty());
    EXPECT_EQ(engine_->index().size(), 0u);
}

TEST_F(TrackingEngineTest, CancelDiscardsPendingData) {
    Reply r = engine_->handle_cancel(kUser);
    EXPECT_EQ(r.code, ReplyCode::NothingToCancel);

    embedder_.set_image("a.jpg", axis(kDims, 1));
    engine_->handle_photo(kUser, photo("a.jpg"));
    engine_->handle_text(kUser, "Pebble");

    r = engine_->handle_cancel(kUser);
    EXPECT_EQ(r.code, ReplyCode::Cancelled);
    EXPECT_EQ(r.state, SessionState::Idle);
    EXPECT_EQ(engine_->session_state(kUser), SessionState::Idle);

    r = engine_->handle_text(kUser, "hello");
    EXPECT_EQ(r.code, ReplyCode::SendPhoto);
    EXPECT_TRUE(items_.list_all().empty());
}

TEST_F(TrackingEngineTest, NewPhotoRestartsFlow) {
    embedder_.set_image("a.jpg", axis(kDims, 1));
    embedder_.set_image("b.jpg", axis(kDims, 2));
    engine_->handle_photo(kUser, photo("a.jpg"));
    engine_->handle_text(kUser, "First");

    Reply r = engine_->handle_photo(kUser, photo("b.jpg"));
    EXPECT_EQ(r.code, ReplyCode::EnterName);
    EXPECT_EQ(r.state, SessionState::AwaitingName);

    engine_->handle_text(kUser, "Second");
    engine_->handle_skip(kUser);
    r = engine_->handle_skip(kUser);
    EXPECT_EQ(r.item->name, "Second");
    EXPECT_EQ(r.record->photo_ref, "file:b.jpg");
}

TEST_F(TrackingEngineTest, ExpiredSessionIsTreatedAsCancelled) {
    embedder_.set_image("a.jpg", axis(kDims, 1));
    engine_->handle_photo(kUser, photo("a.jpg"));
    engine_->handle_text(kUser, "Pebble");

    clock_.advance(std::chrono::minutes(31));
    Reply r = engine_->handle_text(kUser, "a description");
    EXPECT_EQ(r.code, ReplyCode::SessionExpired);
    EXPECT_TRUE(r.session_expired);
    EXPECT_EQ(r.state, SessionState::Idle);
    EXPECT_TRUE(items_.list_all().empty());
}

TEST_F(TrackingEngineTest, ActivityWithinTtlKeepsSession) {
    embedder_.set_image("a.jpg", axis(kDims, 1));
    engine_->handle_photo(kUser, photo("a.jpg"));
    clock_.advance(std::chrono::minutes(20));
    engine_->handle_text(kUser, "Pebble");
    clock_.advance(std::chrono::minutes(20));

    Reply r = engine_->handle_skip(kUser);
    EXPECT_EQ(r.code, ReplyCode::EnterLocation);
    EXPECT_FALSE(r.session_expired);
}

TEST_F(TrackingEngineTest, SweepEvictsExpiredSessions) {
    embedder_.set_image("a.jpg", axis(kDims, 1));
    engine_->handle_photo(1, photo("a.jpg"));
    engine_->handle_photo(2, photo("a.jpg"));

    clock_.advance(std::chrono::minutes(31));
    EXPECT_EQ(engine_->sweep_expired_sessions(), 2u);
    EXPECT_EQ(engine_->sweep_expired_sessions(), 0u);
}

TEST_F(TrackingEngineTest, RendererFailureDoesNotFailSighting) {
    ItemId id = seed_item("rock", axis(kDims, 0));
    embedder_.set_image("rock.jpg", axis(kDims, 0));
    renderer_.unavailable = true;

    engine_->handle_photo(kUser, photo("rock.jpg"));
    Reply r = engine_->handle_location(kUser, LocationInput::coordinates(52.0, 21.0));
    EXPECT_EQ(r.code, ReplyCode::SightingRecorded);
    EXPECT_EQ(renderer_.calls, 1);
    EXPECT_TRUE(r.route_image.empty());
    EXPECT_EQ(history_.count_for_item(id), 2u);
}

TEST_F(TrackingEngineTest, RouteAccumulatesSightings) {
    ItemId id = seed_item("rock", axis(kDims, 0));
    embedder_.set_image("rock.jpg", axis(kDims, 0));

    const GeoPoint stops[] = {{52.23, 21.01}, {50.06, 19.94}, {51.11, 17.03}};
    for (const auto& p : stops) {
        clock_.advance(std::chrono::minutes(1));
        engine_->handle_photo(kUser, photo("rock.jpg"));
        engine_->handle_location(kUser, LocationInput::coordinates(p.latitude, p.longitude));
    }

    RouteGeometry route = engine_->route(id);
    ASSERT_EQ(route.points.size(), 3u);
    EXPECT_EQ(route.points[0].role, MarkerRole::Start);
    EXPECT_EQ(route.points[1].role, MarkerRole::Waypoint);
    EXPECT_EQ(route.points[2].role, MarkerRole::End);
    EXPECT_EQ(route.points[2].position, stops[2]);
    EXPECT_EQ(renderer_.last.points.size(), 3u);
}

TEST_F(TrackingEngineTest, TextSearchRanksMatches) {
    ItemId a = seed_item("red stone", axis(kDims, 0));
    seed_item("blue stone", axis(kDims, 1));
    Embedding query(kDims, 0.0f);
    query[0] = 0.6f;
    query[1] = 0.4f;
    query[2] = std::sqrt(1.0f - 0.36f - 0.16f);
    embedder_.set_text("red", query);

    Reply r = engine_->handle_text_search(kUser, "red");
    EXPECT_EQ(r.kind, ReplyKind::List);
    EXPECT_EQ(r.code, ReplyCode::SearchResults);
    ASSERT_EQ(r.matches.size(), 2u);
    EXPECT_EQ(r.matches[0].item_id, a);
    EXPECT_EQ(r.matches[0].name, "red stone");
    EXPECT_NEAR(r.matches[0].similarity, 0.6f, 1e-4f);
    EXPECT_NEAR(r.matches[1].similarity, 0.4f, 1e-4f);

    embedder_.set_unavailable(true);
    r = engine_->handle_text_search(kUser, "red");
    EXPECT_EQ(r.code, ReplyCode::RetryStep);
}

TEST_F(TrackingEngineTest, ListingsAndDeletion) {
    ItemId mine = seed_item("mine", axis(kDims, 0), kUser);
    ItemId theirs = seed_item("theirs", axis(kDims, 1), 7);
    history_.append(mine, Observation{kUser, "p", GeoPoint{52.0, 21.0}, std::nullopt}, clock_.now());

    Reply r = engine_->user_items(kUser);
    EXPECT_EQ(r.code, ReplyCode::UserItems);
    ASSERT_EQ(r.items.size(), 1u);
    EXPECT_EQ(r.items[0].id, mine);
    EXPECT_EQ(r.items[0].history_count, 2u);
    ASSERT_TRUE(r.items[0].latest_location.has_value());
    EXPECT_DOUBLE_EQ(r.items[0].latest_location->latitude, 52.0);

    auto catalog = engine_->catalog_overview();
    EXPECT_EQ(catalog.size(), 2u);

    EXPECT_TRUE(engine_->delete_item(theirs));
    EXPECT_FALSE(engine_->delete_item(theirs));
    EXPECT_EQ(engine_->index().size(), 1u);
    EXPECT_EQ(history_.count_for_item(theirs), 0u);
    EXPECT_EQ(engine_->catalog_overview().size(), 1u);
}

TEST_F(TrackingEngineTest, LanguagePreference) {
    EXPECT_EQ(engine_->language(kUser), "pl");

    Reply r = engine_->set_language(kUser, "de");
    EXPECT_EQ(r.code, ReplyCode::UnsupportedLanguage);
    EXPECT_EQ(engine_->language(kUser), "pl");

    r = engine_->set_language(kUser, "en");
    EXPECT_EQ(r.code, ReplyCode::LanguageChanged);
    EXPECT_EQ(r.language, "en");

    r = engine_->handle_text(kUser, "hi");
    EXPECT_EQ(r.language, "en");
}

TEST_F(TrackingEngineTest, WarmIndexLoadsPersistedItems) {
    NewItem item{"old", std::nullopt, axis(kDims, 4), "p", 1};
    items_.register_item(item, Observation{1, "p", std::nullopt, std::nullopt}, clock_.now());
    NewItem broken{"broken", std::nullopt, Embedding(3, 1.0f), "p", 1};
    items_.register_item(broken, Observation{1, "p", std::nullopt, std::nullopt}, clock_.now());

    EXPECT_EQ(engine_->warm_index(), 1u);
    EXPECT_EQ(engine_->index().size(), 1u);
}

namespace {

class CancelFromStateTest : public EngineFixture,
                            public ::testing::WithParamInterface<SessionState> {
protected:
    // Drives kUser into the requested state; item 1 sits on axis 1.
    void enter(SessionState target) {
        if (target == SessionState::AwaitingConfirmation) {
            ASSERT_EQ(engine_->handle_photo(kUser, photo("known.jpg")).state, target);
            return;
        }
        ASSERT_EQ(engine_->handle_photo(kUser, photo("fresh.jpg")).state, SessionState::AwaitingName);
        if (target == SessionState::AwaitingName) return;
        ASSERT_EQ(engine_->handle_text(kUser, "Discarded").state, SessionState::AwaitingDescription);
        if (target == SessionState::AwaitingDescription) return;
        ASSERT_EQ(engine_->handle_text(kUser, "left behind").state, SessionState::AwaitingLocation);
    }
};

} // namespace

TEST_P(CancelFromStateTest, DiscardsPendingDataAndLeavesStoresUntouched) {
    const ItemId known = seed_item("Known", axis(kDims, 1));
    embedder_.set_image("known.jpg", axis(kDims, 1));
    embedder_.set_image("fresh.jpg", axis(kDims, 2));
    enter(GetParam());

    Reply r = engine_->handle_cancel(kUser);
    EXPECT_EQ(r.kind, ReplyKind::Confirmation);
    EXPECT_EQ(r.code, ReplyCode::Cancelled);
    EXPECT_EQ(r.state, SessionState::Idle);
    EXPECT_EQ(engine_->session_state(kUser), SessionState::Idle);
    EXPECT_EQ(history_.count_for_item(known), 1u);
    EXPECT_EQ(items_.list_all().size(), 1u);
    EXPECT_EQ(engine_->index().size(), 1u);

    // A location right after cancel commits nothing
    r = engine_->handle_location(kUser, LocationInput::coordinates(50.0, 20.0));
    EXPECT_EQ(r.code, ReplyCode::SendPhoto);
    EXPECT_EQ(history_.count_for_item(known), 1u);

    // A fresh flow starts clean
    r = engine_->handle_photo(kUser, photo("fresh.jpg"));
    EXPECT_EQ(r.code, ReplyCode::EnterName);
    EXPECT_FALSE(r.item.has_value());
    r = engine_->handle_text(kUser, "Newcomer");
    EXPECT_EQ(r.pending_name, "Newcomer");
    engine_->handle_skip(kUser);
    r = engine_->handle_skip(kUser);
    ASSERT_EQ(r.code, ReplyCode::ItemRegistered);
    EXPECT_EQ(r.item->name, "Newcomer");
    EXPECT_FALSE(r.item->description.has_value());
    EXPECT_EQ(history_.count_for_item(known), 1u);
    EXPECT_EQ(engine_->index().size(), 2u);
}

INSTANTIATE_TEST_SUITE_P(NonIdleStates, CancelFromStateTest,
                         ::testing::Values(SessionState::AwaitingConfirmation,
                                           SessionState::AwaitingName,
                                           SessionState::AwaitingDescription,
                                           SessionState::AwaitingLocation));
