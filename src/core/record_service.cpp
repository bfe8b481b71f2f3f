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

#include <kcenon/record_client/core/record_service.h>

#include <kcenon/record_client/core/error_codes.h>

namespace record_client
{

seed_connection_source::seed_connection_source(std::string identity,
											   std::string endpoint,
											   uint32_t max_pool_size,
											   authenticator auth)
	: identity_(std::move(identity))
	, endpoint_(std::move(endpoint))
	, max_pool_size_(max_pool_size)
	, authenticate_(std::move(auth))
{
}

std::string seed_connection_source::name() const
{
	return identity_ + "@" + endpoint_;
}

uint32_t seed_connection_source::max_pool_size() const
{
	return max_pool_size_;
}

kcenon::common::Result<std::shared_ptr<service_handle>> seed_connection_source::seed_handle()
{
	std::lock_guard<std::mutex> lock(seed_mutex_);

	if (seed_)
	{
		return seed_;
	}

	if (!authenticate_)
	{
		return make_error(error_code::authentication_failure,
						  "No authenticator configured for " + name(),
						  "seed_connection_source");
	}

	++authentication_count_;
	auto result = authenticate_();
	if (result.is_err())
	{
		return result.error();
	}

	auto handle = std::move(result.value());
	if (!handle)
	{
		return make_error(error_code::authentication_failure,
						  "Authenticator returned no handle for " + name(),
						  "seed_connection_source");
	}

	seed_ = std::shared_ptr<service_handle>(std::move(handle));
	return seed_;
}

void seed_connection_source::invalidate_seed()
{
	std::lock_guard<std::mutex> lock(seed_mutex_);
	seed_.reset();
}

uint64_t seed_connection_source::authentication_count() const
{
	std::lock_guard<std::mutex> lock(seed_mutex_);
	return authentication_count_;
}

} // namespace record_client
