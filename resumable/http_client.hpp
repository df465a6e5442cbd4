#ifndef RESUMABLE_HTTP_CLIENT_HPP
#define RESUMABLE_HTTP_CLIENT_HPP

// HTTP Client functionality
#include <resumable/http/client/client.hpp>               // client class and http::get (blocking)
#include <resumable/http/client/async_client.hpp>         // async_client class (coroutines on a caller io_context)
#include <resumable/http/client/download_stream.hpp>      // download_stream (returned by client.get())
#include <resumable/http/client/download_source.hpp>      // Boost.Iostreams source over a download_stream
#include <resumable/http/client/resumable_stream.hpp>     // resumable_stream (returned by async_client.get())
#include <resumable/http/client/connection_transport.hpp> // default transport
#include <resumable/http/client/stream_types.hpp>         // stream_info, stream_result for streaming downloads
#include <resumable/http/client/request_builder.hpp>      // request_builder for fluent API

// Common HTTP types needed by client
#include <resumable/http/common/http_request.hpp>
#include <resumable/http/common/http_response.hpp>

// Logging control
#include <resumable/util/logger.hpp>

#endif
