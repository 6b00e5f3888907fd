#pragma once

// Compile-time defaults, overridable at runtime through UploaderConfig

#ifndef MPUPLOAD_BACKEND_URL
#define MPUPLOAD_BACKEND_URL "https://multipart-upload.mlehbib.com"
#endif

#define MPUPLOAD_CHUNK_SIZE (5ULL * 1024 * 1024)
#define MPUPLOAD_REQUEST_TIMEOUT_SECONDS 30L
#define MPUPLOAD_CONNECT_TIMEOUT_SECONDS 10L
#define MPUPLOAD_RETRY_BACKOFF_MS 500L
#define MPUPLOAD_MAX_PART_RETRIES 100
#define MPUPLOAD_MAX_RETRY_BACKOFF_MS 60000L
