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

#include <kcenon/record_client/resilience/fault_classifier.h>

#include <algorithm>
#include <cctype>
#include <iterator>

namespace record_client::resilience
{

namespace
{

std::string to_lower(std::string_view text)
{
	std::string result(text);
	std::transform(result.begin(), result.end(), result.begin(),
				   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
	return result;
}

bool contains(const std::string& haystack, std::string_view needle)
{
	return haystack.find(needle) != std::string::npos;
}

bool is_permission_code(int fault_code) noexcept
{
	return std::find(std::begin(permission_fault_codes), std::end(permission_fault_codes),
					 fault_code)
		   != std::end(permission_fault_codes);
}

} // namespace

bool is_service_protection_code(int fault_code) noexcept
{
	return std::find(std::begin(service_protection_codes), std::end(service_protection_codes),
					 fault_code)
		   != std::end(service_protection_codes);
}

fault_class classify(const service_response& response)
{
	if (is_service_protection_code(response.fault_code))
	{
		return fault_class::rate_limit;
	}

	switch (response.status)
	{
	case status_code::ok:
		return fault_class::none;
	case status_code::rate_limited:
		return fault_class::rate_limit;
	case status_code::authentication_failed:
		return fault_class::authentication;
	case status_code::timeout:
	case status_code::connection_failed:
		return fault_class::connection;
	case status_code::server_busy:
		return fault_class::transient;
	case status_code::permission_denied:
	case status_code::invalid_request:
	case status_code::not_found:
		return fault_class::business;
	case status_code::error:
	default:
		break;
	}

	if (is_permission_code(response.fault_code))
	{
		return fault_class::business;
	}
	if (requires_reauthentication(response.message))
	{
		return fault_class::authentication;
	}
	if (is_transient_message(response.message))
	{
		return fault_class::transient;
	}
	return fault_class::business;
}

bool requires_reauthentication(std::string_view message)
{
	auto text = to_lower(message);

	if (contains(text, "401") || contains(text, "unauthorized"))
	{
		return true;
	}
	if (contains(text, "token") && contains(text, "expired"))
	{
		return true;
	}
	if (contains(text, "credential") && (contains(text, "invalid") || contains(text, "expired")))
	{
		return true;
	}
	return contains(text, "aadsts");
}

bool is_transient_message(std::string_view message)
{
	auto text = to_lower(message);

	return contains(text, "deadlock") || contains(text, "lock contention")
		   || contains(text, "resource-creation contention") || contains(text, "try again");
}

std::string user_message(fault_class value)
{
	switch (value)
	{
	case fault_class::none:
		return "";
	case fault_class::rate_limit:
		return "Service protection limit reached. Requests resume after the retry-after delay.";
	case fault_class::authentication:
		return "Your session has expired. Please re-authenticate to continue.";
	case fault_class::connection:
		return "The service could not be reached. Check network connectivity and the endpoint.";
	case fault_class::transient:
		return "The service reported a temporary conflict. The request can be retried.";
	case fault_class::business:
	default:
		return "The service rejected the request. Check the record data and your permissions.";
	}
}

error_code to_error_code(fault_class value) noexcept
{
	switch (value)
	{
	case fault_class::none:
		return error_code::success;
	case fault_class::rate_limit:
		return error_code::rate_limited;
	case fault_class::authentication:
		return error_code::authentication_failure;
	case fault_class::connection:
		return error_code::connection_failure;
	case fault_class::transient:
		return error_code::transient_contention;
	case fault_class::business:
	default:
		return error_code::remote_fault;
	}
}

fault_class classify_error(const kcenon::common::error_info& error) noexcept
{
	switch (static_cast<error_code>(error.code))
	{
	case error_code::success:
		return fault_class::none;
	case error_code::rate_limited:
		return fault_class::rate_limit;
	case error_code::authentication_failure:
		return fault_class::authentication;
	case error_code::connection_failure:
		return fault_class::connection;
	case error_code::transient_contention:
		return fault_class::transient;
	default:
		return fault_class::business;
	}
}

} // namespace record_client::resilience
