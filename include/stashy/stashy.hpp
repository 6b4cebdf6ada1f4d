#pragma once

/**
 * stashy - command-line client for a remote snippet service.
 *
 * Authenticated CRUD and search over HTTP(S), API keys in the platform
 * secret store, multipart uploads.
 */

#include <stashy/api_client.hpp>
#include <stashy/config_store.hpp>
#include <stashy/credential_vault.hpp>
#include <stashy/http/curl_transport.hpp>
#include <stashy/http/multipart.hpp>
#include <stashy/http/transport.hpp>
#include <stashy/json_codec.hpp>
#include <stashy/language_detector.hpp>
#include <stashy/result.hpp>
#include <stashy/secret_service_vault.hpp>
#include <stashy/session.hpp>
#include <stashy/snippet_draft.hpp>
#include <stashy/snippet_service.hpp>
#include <stashy/types.hpp>
#include <stashy/util/logger.hpp>
#include <stashy/version.hpp>
