#ifndef ballot_log_sink_hpp
#define ballot_log_sink_hpp

#include <ballot/log_severity.hpp>

#include <memory>
#include <string>
#include <utility>

namespace ballot {

/**
 * A destination for logging messages.
 *
 * Applications configure where the library logs go by adding one or more sinks to @c ballot::log::instance().
 */
class log_sink {
public:
  virtual ~log_sink() {}

  /**
   * Log the given message to the sink.
   *
   * @param sev the severity of the message.
   * @param message the formatted message.
   */
  virtual void log(severity sev, std::string&& message) = 0;
};

/**
 * Adapt any functor with signature void(severity, std::string&&) into a @c ballot::log_sink.
 *
 * @tparam Functor the type of the functor to adapt.
 */
template <typename Functor>
class log_to_functor : public log_sink {
public:
  explicit log_to_functor(Functor&& f)
      : functor_(std::move(f)) {
  }

  void log(severity sev, std::string&& message) override {
    functor_(sev, std::move(message));
  }

private:
  Functor functor_;
};

/**
 * Create a @c ballot::log_sink from a functor, typically a lambda.
 *
 * @code
 * ballot::log::instance().add_sink(ballot::make_log_sink([](ballot::severity, std::string&& msg) {
 *   std::cerr << msg << std::endl;
 * }));
 * @endcode
 */
template <typename Functor>
std::shared_ptr<log_sink> make_log_sink(Functor&& f) {
  using functor_type = typename std::decay<Functor>::type;
  return std::make_shared<log_to_functor<functor_type>>(functor_type(std::forward<Functor>(f)));
}

} // namespace ballot

#endif // ballot_log_sink_hpp
