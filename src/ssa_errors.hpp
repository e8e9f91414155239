#pragma once

#include <stdexcept>
#include <string>

namespace ssa {

// Base of every error a caller can recover from by changing parameters
struct SsaError : std::runtime_error { using std::runtime_error::runtime_error; };

// Series shorter than 2 samples
struct EmptySeries : SsaError { using SsaError::SsaError; };

// L outside [2, N-1], or a degenerate trajectory matrix
struct InvalidWindowLength : SsaError { using SsaError::SsaError; };

// Group index outside [1, d]
struct IndexOutOfRange : SsaError { using SsaError::SsaError; };

// SVD did not converge or produced non-finite values
struct NumericFailure : SsaError { using SsaError::SsaError; };

// Requested truncation below 1
struct InvalidTruncation : SsaError { using SsaError::SsaError; };

// Cancellation token fired or deadline passed
struct Cancelled : SsaError { using SsaError::SsaError; };

// Reconstruction produced a series of the wrong length. This is a bug,
// not a user error.
struct ShapeMismatch : std::logic_error { using std::logic_error::logic_error; };

}
