#ifndef ballot_node_reader_hpp
#define ballot_node_reader_hpp

#include <ballot/coordination_client.hpp>

#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <string>

namespace ballot {
class node_reader;

/**
 * Receive the outcome of a node_reader.
 *
 * Exactly one of the member functions is called, at most once.  Exceptions raised by the listener are logged and
 * discarded.
 */
class node_reader_listener {
public:
  virtual ~node_reader_listener() = default;

  /// The node exists, and these are its contents.
  virtual void on_read(node_reader& reader, std::string const& data, node_stat const& stat) = 0;

  /// The reader stopped before reading the node, because finish() was called or the client closed.
  virtual void on_gave_up(node_reader& reader) = 0;
};

/**
 * Create a @c node_reader_listener that forwards to the given functors, empty functors are no-ops.
 */
std::shared_ptr<node_reader_listener> make_node_reader_listener(
    std::function<void(node_reader&, std::string const&, node_stat const&)> on_read,
    std::function<void(node_reader&)> on_gave_up = std::function<void(node_reader&)>());

/**
 * Wait until a node exists and read its contents.
 *
 * Applications use this class to find out the identity of the current leader without running for election, or to
 * read any other configuration node that may not exist yet.
 *
 * @code
 * auto reader = ballot::node_reader::create(client);
 * reader->path("/services/foo/leader").listener(ballot::make_node_reader_listener(
 *     [](ballot::node_reader&, std::string const& data, ballot::node_stat const&) { std::cout << data << "\n"; }));
 * reader->start();
 * @endcode
 */
class node_reader : public std::enable_shared_from_this<node_reader> {
public:
  //@{
  /// @name factory functions.
  static std::shared_ptr<node_reader> create();
  static std::shared_ptr<node_reader> create(std::shared_ptr<coordination_client> client);
  //@}

  node_reader(node_reader const&) = delete;
  node_reader& operator=(node_reader const&) = delete;

  //@{
  /// @name configuration, raise std::logic_error after start().
  node_reader& client(std::shared_ptr<coordination_client> client);
  node_reader& path(std::string path);
  node_reader& listener(std::shared_ptr<node_reader_listener> listener);
  //@}

  std::string const& path() const {
    return path_;
  }

  /**
   * Start reading the node.
   *
   * @throws not_configured if the client or the path are missing.
   * @throws std::logic_error if called more than once.
   */
  void start();

  /// Stop waiting for the node, honored before the next coordination request.
  void finish();

  /// Return true once the node was read or the reader gave up.
  bool done() const;

private:
  node_reader();

  void check_configurable(char const* what) const;

  //@{
  /// @name each step, preceded by the termination gate.
  void read();
  void wait(std::uint64_t generation);
  //@}

  //@{
  /// @name handle the completion of each step.
  void on_read_completed(result_code rc, std::string const& data, node_stat const& stat);
  void on_exists_completed(result_code rc);
  void on_watch(watch_event const& ev, std::uint64_t generation);
  //@}

  /// Stop if finish() was called or the client cannot recover, must be called with the lock held.
  bool gate_closed();

  template <typename Functor>
  void notify(char const* what, Functor&& functor);

private:
  mutable std::recursive_mutex mu_;
  std::shared_ptr<coordination_client> client_;
  std::string path_;
  std::shared_ptr<node_reader_listener> listener_;
  bool started_;
  bool finish_requested_;
  bool done_;
  std::uint64_t watch_generation_;
};

} // namespace ballot

#endif // ballot_node_reader_hpp
