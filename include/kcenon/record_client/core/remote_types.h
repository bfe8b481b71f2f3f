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
 * @file remote_types.h
 * @brief Request and response types exchanged with the remote record service
 *
 * Defines the operation kinds, service status codes and the plain data
 * structures carried by a service_handle call.
 *
 * ## Thread Safety
 * All types are plain data structures with no internal synchronization.
 * Instances are built by one thread and handed to a single handle call.
 *
 * @code
 * using namespace record_client;
 *
 * service_request request;
 * request.type = request_type::create_multiple;
 * request.entity = "account";
 * request.targets.push_back(record{ "", { { "name", "Contoso" } }, {} });
 *
 * auto kind = parse_operation_kind("upsert");  // operation_kind::upsert
 * std::string_view status = to_string(status_code::rate_limited);  // "RATE_LIMITED"
 * @endcode
 */

#pragma once

#include <chrono>
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace record_client
{

/**
 * @enum operation_kind
 * @brief Logical bulk operation requested by the caller
 */
enum class operation_kind : uint8_t
{
	create = 0, ///< Insert new records
	update = 1, ///< Modify existing records (ids required)
	upsert = 2, ///< Insert or modify records
	del = 3,    ///< Remove records (ids required)
};

/**
 * @enum request_type
 * @brief Native request shape sent to the service
 */
enum class request_type : uint8_t
{
	create_multiple = 0,  ///< Multi-record create
	update_multiple = 1,  ///< Multi-record update
	upsert_multiple = 2,  ///< Multi-record upsert
	delete_multiple = 3,  ///< True multi-record delete
	execute_multiple = 4, ///< Aggregated sequential per-record requests
	custom = 5,           ///< Named single request
};

/**
 * @enum status_code
 * @brief Status codes reported by the remote service
 */
enum class status_code : uint16_t
{
	ok = 0,                    ///< Request executed successfully
	error = 1,                 ///< General failure, see message
	timeout = 2,               ///< Request timed out in transit
	connection_failed = 3,     ///< Network-level failure
	authentication_failed = 4, ///< Token rejected or expired
	permission_denied = 5,     ///< Caller lacks privileges
	invalid_request = 6,       ///< Request rejected by validation on the service
	not_found = 7,             ///< Target record does not exist
	rate_limited = 8,          ///< Service protection limit exceeded
	server_busy = 9,           ///< Transient contention on the service
};

constexpr std::string_view to_string(operation_kind kind) noexcept
{
	switch (kind)
	{
	case operation_kind::create:
		return "create";
	case operation_kind::update:
		return "update";
	case operation_kind::upsert:
		return "upsert";
	case operation_kind::del:
		return "delete";
	default:
		return "unknown";
	}
}

constexpr std::string_view to_string(request_type type) noexcept
{
	switch (type)
	{
	case request_type::create_multiple:
		return "CreateMultiple";
	case request_type::update_multiple:
		return "UpdateMultiple";
	case request_type::upsert_multiple:
		return "UpsertMultiple";
	case request_type::delete_multiple:
		return "DeleteMultiple";
	case request_type::execute_multiple:
		return "ExecuteMultiple";
	case request_type::custom:
		return "Custom";
	default:
		return "Unknown";
	}
}

/**
 * @brief Convert status_code to string representation
 * @param code The status code to convert
 * @return String representation of the status code
 */
constexpr std::string_view to_string(status_code code) noexcept
{
	switch (code)
	{
	case status_code::ok:
		return "OK";
	case status_code::error:
		return "ERROR";
	case status_code::timeout:
		return "TIMEOUT";
	case status_code::connection_failed:
		return "CONNECTION_FAILED";
	case status_code::authentication_failed:
		return "AUTHENTICATION_FAILED";
	case status_code::permission_denied:
		return "PERMISSION_DENIED";
	case status_code::invalid_request:
		return "INVALID_REQUEST";
	case status_code::not_found:
		return "NOT_FOUND";
	case status_code::rate_limited:
		return "RATE_LIMITED";
	case status_code::server_busy:
		return "SERVER_BUSY";
	default:
		return "UNKNOWN";
	}
}

/**
 * @brief Parse operation_kind from string
 * @param str String representation of the operation
 * @return Corresponding operation_kind, or std::nullopt when unknown
 */
inline std::optional<operation_kind> parse_operation_kind(std::string_view str) noexcept
{
	if (str == "create" || str == "CREATE")
		return operation_kind::create;
	if (str == "update" || str == "UPDATE")
		return operation_kind::update;
	if (str == "upsert" || str == "UPSERT")
		return operation_kind::upsert;
	if (str == "delete" || str == "DELETE")
		return operation_kind::del;
	return std::nullopt;
}

/**
 * @struct record_reference
 * @brief Foreign key held by a record
 */
struct record_reference
{
	std::string field;         ///< Lookup attribute name
	std::string target_entity; ///< Entity the lookup points at
	std::string target_id;     ///< Identifier of the referenced record
};

/**
 * @struct record
 * @brief One record submitted to a bulk operation
 */
struct record
{
	std::string id; ///< Record identifier (empty when the service assigns it)
	std::map<std::string, std::string> attributes;
	std::vector<record_reference> references;
};

/**
 * @struct service_request
 * @brief Request passed to service_handle::execute
 */
struct service_request
{
	request_type type = request_type::custom;
	std::string name;                         ///< Request name for custom requests
	std::string entity;                       ///< Target entity logical name
	std::vector<record> targets;              ///< Records for create/update/upsert
	std::vector<std::string> target_ids;      ///< Ids for delete requests
	bool continue_on_error = false;           ///< ExecuteMultiple setting
	std::map<std::string, std::string> parameters; ///< Optional request parameters
};

/**
 * @struct item_fault
 * @brief Failure of a single record inside a multi-record response
 */
struct item_fault
{
	size_t index = 0; ///< Position of the record within the request
	int code = 0;     ///< Service error code
	std::string message;
};

/**
 * @struct service_response
 * @brief Response returned by service_handle::execute
 */
struct service_response
{
	status_code status = status_code::ok;
	int fault_code = 0;                                  ///< Service specific fault code
	std::string message;                                 ///< Fault message when status != ok
	std::optional<std::chrono::milliseconds> retry_after; ///< Suggested wait for rate_limited
	std::vector<std::string> created_ids;                ///< Ids assigned by create requests
	std::vector<bool> upsert_created;                    ///< Per record: true = created, false = updated
	std::vector<item_fault> item_faults;                 ///< Per record failures (partial success)

	[[nodiscard]] bool is_ok() const noexcept { return status == status_code::ok; }
};

} // namespace record_client
