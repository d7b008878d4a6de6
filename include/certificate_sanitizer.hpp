#pragma once

#include <string>
#include "certificate.hpp"

namespace wkd {

/**
 * Reduces a certificate to what a WKD client needs for one address:
 *   1. only one user id declaring exactly `target_email`, preferring one
 *      that is valid now,
 *   2. no user attributes,
 *   3. only subkeys whose newest self-signature allows signing or
 *      transport encryption.
 * The input certificate is not modified.
 * @throws PolicyError if the certificate cannot be evaluated.
 */
Certificate sanitize(const Certificate& cert, const std::string& target_email);

}
