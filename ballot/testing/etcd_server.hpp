#ifndef ballot_testing_etcd_server_hpp
#define ballot_testing_etcd_server_hpp

#include <grpc++/grpc++.h>

#include <chrono>
#include <memory>
#include <string>

namespace ballot {
namespace testing {

/// The address of the etcd server for integration tests, $BALLOT_ETCD_ADDRESS or localhost:2379.
std::string etcd_address();

/**
 * Connect to the etcd server for integration tests.
 *
 * @return a null pointer if the server does not answer within @a timeout, the tests skip themselves in that case.
 */
std::shared_ptr<grpc::Channel> connect_to_etcd(std::chrono::milliseconds timeout);

} // namespace testing
} // namespace ballot

#endif // ballot_testing_etcd_server_hpp
