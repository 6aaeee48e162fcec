#pragma once

#include <recfetch/recfetch_export.h>

#include <filesystem>
#include <optional>
#include <recfetch/result.hpp>
#include <recfetch/types.hpp>

namespace recfetch {

/// Authenticated access to the learning platform.
class RECFETCH_EXPORT SessionProvider {
   public:
	virtual ~SessionProvider() = default;

	// Establishes the session. Errors here are environment failures
	// (errc::credentials_missing, errc::login_failed) and abort the run.
	virtual Result<void> open() = 0;

	// Where to find the media of one recording. nullopt if there is none.
	virtual std::optional<MediaSource> resolve_media_source(
		RecordingNumber number) = 0;

	// Netscape-format cookie jar for the downloader, valid after open().
	[[nodiscard]] virtual std::filesystem::path cookie_jar_path() const = 0;
};

}  // namespace recfetch
