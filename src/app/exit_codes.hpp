#pragma once

namespace hookgate::app {

// Host contract: 2 blocks the operation (or keeps the session alive on a
// stop event); 3 means loop state could not be saved; anything else allows.
inline constexpr int kExitOk = 0;
inline constexpr int kExitUsage = 1;
inline constexpr int kExitBlock = 2;
inline constexpr int kExitPersistenceFailure = 3;

}  // namespace hookgate::app
