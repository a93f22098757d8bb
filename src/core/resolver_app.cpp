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

#include <kcenon/dependency_resolver/resolver_app.h>

#include <kcenon/dependency_resolver/catalog/snapshot_catalog.h>
#include <kcenon/dependency_resolver/core/error_codes.h>
#include <kcenon/dependency_resolver/logging/console_logger.h>

#include <csignal>
#include <iostream>
#include <sstream>

namespace dependency_resolver
{

using kcenon::common::interfaces::log_level;

namespace
{

kcenon::common::error_info config_error(const std::string& message)
{
	return kcenon::common::error_info{ error_codes::invalid_config, message, "resolver_app" };
}

} // namespace

// Static member initialization
resolver_app* resolver_app::instance_ = nullptr;

resolver_app::resolver_app()
	: state_(app_state::uninitialized),
	  metrics_(std::make_shared<metrics::resolver_metrics>()),
	  cancellation_(std::make_shared<cancellation_token>())
{
}

resolver_app::~resolver_app()
{
	if (instance_ == this)
	{
		instance_ = nullptr;
	}
}

kcenon::common::VoidResult resolver_app::initialize(const resolver_config& config)
{
	if (state_ != app_state::uninitialized)
	{
		return config_error("Resolver already initialized");
	}

	config_ = config;

	auto valid = validate_config();
	if (valid.is_err())
	{
		return valid;
	}

	if (config_.snapshot_file.empty())
	{
		return config_error("No snapshot file configured");
	}

	auto catalog = catalog::snapshot_catalog::load_from_file(config_.snapshot_file);
	if (catalog.is_err())
	{
		return catalog.error();
	}

	auto loaded = catalog.value();
	return do_initialize(loaded, loaded);
}

kcenon::common::VoidResult resolver_app::initialize(
	const resolver_config& config,
	std::shared_ptr<discovery::discovery_service> discovery,
	std::shared_ptr<discovery::catalog_resolver> resolver)
{
	if (state_ != app_state::uninitialized)
	{
		return config_error("Resolver already initialized");
	}

	config_ = config;
	config_.snapshot_file.clear();

	if (!discovery || !resolver)
	{
		return config_error("Discovery service and catalog resolver are required");
	}

	auto valid = validate_config();
	if (valid.is_err())
	{
		return valid;
	}

	return do_initialize(std::move(discovery), std::move(resolver));
}

kcenon::common::VoidResult resolver_app::validate_config() const
{
	auto errors = config_.validation_errors();
	if (errors.empty())
	{
		return kcenon::common::ok();
	}

	std::string message = "Configuration validation failed:";
	for (const auto& error : errors)
	{
		message += "\n  - " + error;
	}
	return config_error(message);
}

kcenon::common::VoidResult resolver_app::do_initialize(
	std::shared_ptr<discovery::discovery_service> discovery,
	std::shared_ptr<discovery::catalog_resolver> resolver)
{
	if (!logger_ && config_.logging.enable_console)
	{
		// Level was checked by validate()
		auto level = logging::parse_log_level(config_.logging.level).value_or(log_level::info);
		logger_ = logging::create_console_logger(level, config_.name);
	}

	pipeline::script_options scripts;
	scripts.strip_session_settings = config_.script.strip_session_settings;
	scripts.batch_terminator = config_.script.batch_terminator;

	pipeline_ = std::make_unique<pipeline::dependency_pipeline>(std::move(discovery),
																std::move(resolver), scripts);
	pipeline_->set_logger(logger_);
	pipeline_->set_metrics(metrics_);
	pipeline_->set_cancellation_token(cancellation_);

	setup_signal_handlers();

	if (logger_)
	{
		(void)logger_->log(log_level::info,
						   "Resolver '" + config_.name + "' initialized"
							   + (config_.snapshot_file.empty()
									  ? std::string()
									  : " from snapshot " + config_.snapshot_file));
	}

	state_ = app_state::initialized;
	return kcenon::common::ok();
}

void resolver_app::set_logger(std::shared_ptr<kcenon::common::interfaces::ILogger> logger)
{
	logger_ = std::move(logger);
	if (pipeline_)
	{
		pipeline_->set_logger(logger_);
	}
}

pipeline::resolve_options resolver_app::make_resolve_options() const
{
	pipeline::resolve_options options;
	options.allow_system_objects = config_.discovery.allow_system_objects;
	options.direction
		= parse_direction(config_.discovery.direction).value_or(discovery_direction::dependents);
	options.include_self = config_.discovery.include_self;
	options.include_script = config_.discovery.include_script;
	return options;
}

int resolver_app::run(const std::vector<std::string>& root_urns, std::ostream& out)
{
	if (state_ != app_state::initialized && state_ != app_state::stopped)
	{
		std::cerr << "Resolver not initialized" << std::endl;
		return exit_codes::error;
	}

	if (root_urns.empty())
	{
		std::cerr << "No root objects supplied" << std::endl;
		return exit_codes::error;
	}

	cancellation_->reset();
	state_ = app_state::running;

	const auto options = make_resolve_options();

	std::vector<pipeline::root_result> results;
	results.reserve(root_urns.size());
	size_t failed = 0;
	size_t record_count = 0;

	for (const auto& urn : root_urns)
	{
		auto identity = object_identity::parse(urn);
		if (identity.is_err())
		{
			pipeline::root_result invalid;
			invalid.failure = pipeline::root_failure{ pipeline_stage::validation, identity.error() };
			out << "Root: " << urn << "\n";
			write_report(invalid, out);
			++failed;
			continue;
		}

		auto result = pipeline_->resolve(identity.value(), options);
		out << "Root: " << result.root.urn() << "\n";
		write_report(result, out);

		if (!result.is_success())
		{
			++failed;
		}
		record_count += result.records.size();
		results.push_back(std::move(result));
	}

	out << "\nSummary: " << root_urns.size() << " root(s), " << failed << " failed, "
		<< record_count << " record(s)\n";

	if (print_scripts_)
	{
		write_scripts(results, out);
	}

	if (logger_)
	{
		(void)logger_->log(log_level::info,
						   "Run finished: " + std::to_string(root_urns.size() - failed) + "/"
							   + std::to_string(root_urns.size()) + " root(s) resolved");
	}

	state_ = app_state::stopped;
	return failed == 0 ? exit_codes::success : exit_codes::partial_failure;
}

void resolver_app::write_report(const pipeline::root_result& result, std::ostream& out) const
{
	if (result.failure)
	{
		const auto& error = result.failure->error;
		out << "  FAILED [" << to_string(result.failure->stage) << "] "
			<< to_string(classify_error(error.code)) << ": " << error.message << "\n";
		return;
	}

	if (result.no_dependencies)
	{
		out << "  (no dependencies)\n";
		return;
	}

	for (const auto& record : result.records)
	{
		out << "  " << record.tier << "\t" << record.dependent_kind << "\t" << record.dependent_name
			<< "\t" << (record.parent ? record.parent_name : std::string("-")) << "\t"
			<< record.owner << "\t" << (record.is_schema_bound ? "schemabound" : "-") << "\n";
	}

	for (const auto& failure : result.node_failures)
	{
		out << "  ! " << failure.identity.urn() << " (tier " << failure.tier
			<< "): " << failure.error.message << "\n";
	}
}

void resolver_app::write_scripts(const std::vector<pipeline::root_result>& results,
								 std::ostream& out) const
{
	for (const auto& result : results)
	{
		for (const auto& record : result.records)
		{
			if (record.script)
			{
				out << "\n" << *record.script;
			}
		}
	}
	out << "\n";
}

void resolver_app::stop()
{
	auto expected = app_state::running;
	if (state_.compare_exchange_strong(expected, app_state::stopping))
	{
		cancellation_->cancel();
	}
}

app_state resolver_app::state() const
{
	return state_.load();
}

const resolver_config& resolver_app::config() const
{
	return config_;
}

const metrics::resolver_metrics& resolver_app::metrics() const
{
	return *metrics_;
}

void resolver_app::setup_signal_handlers()
{
	instance_ = this;

#ifdef _WIN32
	std::signal(SIGINT, signal_handler);
	std::signal(SIGTERM, signal_handler);
#else
	struct sigaction sa;
	sa.sa_handler = signal_handler;
	sigemptyset(&sa.sa_mask);
	sa.sa_flags = 0;

	sigaction(SIGINT, &sa, nullptr);
	sigaction(SIGTERM, &sa, nullptr);
#endif
}

void resolver_app::signal_handler(int /*signal*/)
{
	if (instance_ != nullptr)
	{
		instance_->stop();
	}
}

} // namespace dependency_resolver
