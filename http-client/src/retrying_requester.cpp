#include "retrying_requester.hpp"

namespace httpretry::client {

// Explicit template instantiations for the shipped requester configurations
template class BasicRetryingRequester<retry::NoBackoffPolicy, SilentLoggingPolicy>;
template class BasicRetryingRequester<retry::FixedBackoffPolicy, ConsoleLoggingPolicy>;

}  // namespace httpretry::client
