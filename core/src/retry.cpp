#include "retry.hpp"

namespace httpretry::retry {

// Explicit template instantiations for common retry executor configurations
template class RetryExecutor<NoBackoffPolicy, SilentLoggingPolicy>;
template class RetryExecutor<FixedBackoffPolicy, ConsoleLoggingPolicy>;
template class RetryExecutor<ExponentialBackoffPolicy, ConsoleLoggingPolicy>;

}  // namespace httpretry::retry
