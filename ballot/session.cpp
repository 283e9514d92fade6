#include "ballot/session.hpp"

namespace ballot {

session::~session() noexcept(false) {
}

} // namespace ballot
