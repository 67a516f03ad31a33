/// Compile time knobs, every one of them can be overridden from the build
/// (e.g. -DDUPLEXIO_BUFFER_DEFAULT_SIZE=65536).
#ifndef DUPLEXIO_CONFIG_HPP
#define DUPLEXIO_CONFIG_HPP

/// capacity of the internal buffer of a buffered_reader
#ifndef DUPLEXIO_BUFFER_DEFAULT_SIZE
#define DUPLEXIO_BUFFER_DEFAULT_SIZE 8192
#endif

/// submission queue entries of an io_context
#ifndef DUPLEXIO_URING_ENTRIES
#define DUPLEXIO_URING_ENTRIES 64
#endif

/// environment variable consulted by log_level_from_env()
#ifndef DUPLEXIO_LOG_LEVEL_ENV
#define DUPLEXIO_LOG_LEVEL_ENV "DUPLEXIO_LOG_LEVEL"
#endif

#endif  // DUPLEXIO_CONFIG_HPP
