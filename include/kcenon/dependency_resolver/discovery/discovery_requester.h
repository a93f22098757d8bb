// BSD 3-Clause License
//
// Copyright (c) 2025, kcenon
// All rights reserved.
//
// Redistribution and use in source and binary forms, with or without
// modification, are permitted provided that the following conditions are met:
//
// 1. Redistributions of source code must retain the above copyright notice,
//    this list of conditions and the following disclaimer.
//
// 2. Redistributions in binary form must reproduce the above copyright notice,
//    this list of conditions and the following disclaimer in the documentation
//    and/or other materials provided with the distribution.
//
// 3. Neither the name of the copyright holder nor the names of its
//    contributors may be used to endorse or promote products derived from
//    this software without specific prior written permission.
//
// THIS SOFTWARE IS PROVIDED BY THE COPYRIGHT HOLDERS AND CONTRIBUTORS "AS IS"
// AND ANY EXPRESS OR IMPLIED WARRANTIES, INCLUDING, BUT NOT LIMITED TO, THE
// IMPLIED WARRANTIES OF MERCHANTABILITY AND FITNESS FOR A PARTICULAR PURPOSE
// ARE DISCLAIMED. IN NO EVENT SHALL THE COPYRIGHT HOLDER OR CONTRIBUTORS BE
// LIABLE FOR ANY DIRECT, INDIRECT, INCIDENTAL, SPECIAL, EXEMPLARY, OR
// CONSEQUENTIAL DAMAGES (INCLUDING, BUT NOT LIMITED TO, PROCUREMENT OF
// SUBSTITUTE GOODS OR SERVICES; LOSS OF USE, DATA, OR PROFITS; OR BUSINESS
// INTERRUPTION) HOWEVER CAUSED AND ON ANY THEORY OF LIABILITY, WHETHER IN
// CONTRACT, STRICT LIABILITY, OR TORT (INCLUDING NEGLIGENCE OR OTHERWISE)
// ARISING IN ANY WAY OUT OF THE USE OF THIS SOFTWARE, EVEN IF ADVISED OF THE
// POSSIBILITY OF SUCH DAMAGE.

/**
 * @file discovery_requester.h
 * @brief Validated single-shot access to a discovery service
 *
 * The requester is the first pipeline stage. It validates the roots of a
 * request, issues exactly one call to the discovery service, and wraps any
 * service failure with the root that triggered it. Failures are never
 * retried here; retry policy belongs to the service implementation.
 *
 * Validation rules:
 * - At least one root must be supplied
 * - Every root must carry a non-empty identity with a traceable server
 * - All roots must belong to the same server
 * - Duplicate roots are collapsed, keeping first-occurrence order
 */

#pragma once

#include "discovery_service.h"

#include <kcenon/dependency_resolver/core/dependency_types.h>
#include <kcenon/dependency_resolver/core/object_identity.h>

#include <memory>
#include <vector>

#include <kcenon/common/interfaces/logger_interface.h>
#include <kcenon/common/patterns/result.h>

namespace dependency_resolver::discovery
{

/**
 * @struct discovery_request
 * @brief Parameters of one discovery call
 */
struct discovery_request
{
	std::vector<object_identity> roots;
	bool allow_system_objects = false;
	discovery_direction direction = discovery_direction::dependents;
};

/**
 * @class discovery_requester
 * @brief Issues validated discovery requests
 *
 * Thread Safety:
 * - request() is const and safe to call concurrently if the underlying
 *   service is
 * - set_logger() must not race with request()
 */
class discovery_requester
{
public:
	/**
	 * @brief Construct a requester bound to a discovery service
	 * @param service Discovery service (must not be null for request() to succeed)
	 */
	explicit discovery_requester(std::shared_ptr<discovery_service> service);

	/**
	 * @brief Set the logger used for progress and failure messages
	 */
	void set_logger(std::shared_ptr<kcenon::common::interfaces::ILogger> logger);

	/**
	 * @brief Validate @p request and issue the discovery call
	 * @return Discovered tree, error_codes::invalid_input for bad roots, or
	 *         error_codes::discovery_failed when the service fails
	 */
	[[nodiscard]] kcenon::common::Result<dependency_tree> request(
		const discovery_request& request) const;

private:
	[[nodiscard]] kcenon::common::Result<std::vector<object_identity>> validate_roots(
		const std::vector<object_identity>& roots) const;

	void log(kcenon::common::interfaces::log_level level, const std::string& message) const;

	std::shared_ptr<discovery_service> service_;
	std::shared_ptr<kcenon::common::interfaces::ILogger> logger_;
};

} // namespace dependency_resolver::discovery
