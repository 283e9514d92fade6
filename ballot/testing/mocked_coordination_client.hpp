#ifndef ballot_testing_mocked_coordination_client_hpp
#define ballot_testing_mocked_coordination_client_hpp

#include <ballot/coordination_client.hpp>

#include <gmock/gmock.h>

namespace ballot {
namespace testing {

/**
 * A gmock implementation of ballot::coordination_client.
 *
 * Useful to verify the exact calls made by a component, the callbacks can be captured with SaveArg<>() and invoked
 * later in the test.
 */
class mocked_coordination_client : public coordination_client {
public:
  MOCK_METHOD5(
      async_create, void(std::string const&, std::string const&, acl_list const&, create_mode, create_callback));
  MOCK_METHOD2(async_get, void(std::string const&, get_callback));
  MOCK_METHOD3(async_exists, void(std::string const&, watcher, exists_callback));
  MOCK_CONST_METHOD0(state, client_state());
};

} // namespace testing
} // namespace ballot

#endif // ballot_testing_mocked_coordination_client_hpp
