#include <session/session.hpp>

namespace Stonetrail {

void Session::reset() {
    state = SessionState::Idle;
    is_new = false;
    candidate.reset();
    candidate_history_count = 0;
    pending_embedding.clear();
    photo_ref.clear();
    thumbnail.clear();
    name.reset();
    description.reset();
}

} // namespace Stonetrail
