/**
 * @file gsl.hpp
 * @brief Internal bridge header for gsl-lite v1.
 *
 * Provides a scoped namespace alias for gsl-lite, isolating the
 * dependency to implementation files.
 *
 * gsl-lite v1 uses:
 *   - Namespace: gsl_lite (not gsl)
 *   - Header: <gsl-lite/gsl-lite.hpp> (not <gsl/gsl>)
 *   - Contract macros: gsl_Expects / gsl_Ensures
 *
 * Do NOT include this header from public API headers.
 *
 * @copyright GPL-2.0-or-later
 */

#pragma once

#include <gsl-lite/gsl-lite.hpp>

namespace termattr {

/// Scoped alias for the gsl-lite v1 namespace (termattr::gsl::narrow_cast).
namespace gsl = ::gsl_lite;

} // namespace termattr
