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
 * @file record_service.h
 * @brief Boundary interfaces to the remote record service
 *
 * service_handle is an authenticated client. connection_source supplies the
 * one seed handle per identity from which pooled handles are cloned.
 *
 * Cloning copies the authentication context in memory. It never performs a
 * network round trip and must not be confused with re-authentication, which
 * only happens inside connection_source::seed_handle().
 */

#pragma once

#include "remote_types.h"

#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <string>

#include <kcenon/common/patterns/result.h>

namespace record_client
{

/**
 * @class service_handle
 * @brief Authenticated handle to the remote record service
 *
 * Implementations wrap the transport specific client. A handle is used by one
 * thread at a time; the pool guarantees exclusive checkout.
 */
class service_handle
{
public:
	virtual ~service_handle() = default;

	/**
	 * @brief Create a copy sharing this handle's authentication context
	 * @return New handle, or error if the context could not be copied
	 */
	virtual kcenon::common::Result<std::unique_ptr<service_handle>> clone() const = 0;

	/**
	 * @brief Check whether the handle can accept requests
	 */
	[[nodiscard]] virtual bool is_ready() const = 0;

	/**
	 * @brief Execute one request against the service
	 * @param request Request to send
	 * @return Service response (faults are reported through status)
	 */
	virtual service_response execute(const service_request& request) = 0;

	/**
	 * @brief Server recommended degree of parallelism for this identity
	 */
	[[nodiscard]] virtual uint32_t recommended_parallelism() const = 0;

	/**
	 * @brief Identity the requests are executed on behalf of
	 */
	[[nodiscard]] virtual std::string caller_id() const = 0;

	/**
	 * @brief Override the identity requests are executed on behalf of
	 */
	virtual void set_caller_id(const std::string& caller_id) = 0;

	/**
	 * @brief Enable or disable the server-offered session affinity token
	 */
	virtual void set_session_affinity(bool enabled) = 0;
};

/**
 * @class connection_source
 * @brief Supplier of the authenticated seed handle for one identity
 *
 * A source is supplied at pool construction and outlives the pool.
 */
class connection_source
{
public:
	virtual ~connection_source() = default;

	/**
	 * @brief Unique source name used for throttle tracking and routing
	 */
	[[nodiscard]] virtual std::string name() const = 0;

	/**
	 * @brief Declared maximum parallelism for this identity
	 */
	[[nodiscard]] virtual uint32_t max_pool_size() const = 0;

	/**
	 * @brief Get the seed handle, authenticating if none is cached
	 * @return Seed handle, or authentication/connection error
	 */
	virtual kcenon::common::Result<std::shared_ptr<service_handle>> seed_handle() = 0;

	/**
	 * @brief Drop the cached seed so the next seed_handle() re-authenticates
	 */
	virtual void invalidate_seed() = 0;
};

/**
 * @class seed_connection_source
 * @brief connection_source that caches one seed created by an authenticator
 *
 * The authenticator runs at most once per seed generation, even when many
 * threads ask for the seed concurrently.
 *
 * @code
 * auto source = std::make_shared<seed_connection_source>(
 *     "app-user", "https://org.example.com", 52,
 *     []() { return authenticate_client(); });
 * auto seed = source->seed_handle();
 * @endcode
 */
class seed_connection_source : public connection_source
{
public:
	using authenticator
		= std::function<kcenon::common::Result<std::unique_ptr<service_handle>>()>;

	/**
	 * @brief Construct a seed source
	 * @param identity Identity (profile) name
	 * @param endpoint Service endpoint the identity connects to
	 * @param max_pool_size Declared maximum parallelism
	 * @param auth Callable that authenticates and returns a new seed
	 */
	seed_connection_source(std::string identity,
						   std::string endpoint,
						   uint32_t max_pool_size,
						   authenticator auth);

	~seed_connection_source() override = default;

	seed_connection_source(const seed_connection_source&) = delete;
	seed_connection_source& operator=(const seed_connection_source&) = delete;

	/**
	 * @brief Source name in the form "identity@endpoint"
	 */
	[[nodiscard]] std::string name() const override;

	[[nodiscard]] uint32_t max_pool_size() const override;

	kcenon::common::Result<std::shared_ptr<service_handle>> seed_handle() override;

	void invalidate_seed() override;

	/**
	 * @brief Number of times the authenticator has been invoked
	 */
	[[nodiscard]] uint64_t authentication_count() const;

private:
	std::string identity_;
	std::string endpoint_;
	uint32_t max_pool_size_;
	authenticator authenticate_;

	mutable std::mutex seed_mutex_;
	std::shared_ptr<service_handle> seed_;
	uint64_t authentication_count_{ 0 };
};

} // namespace record_client
