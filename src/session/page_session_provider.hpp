#pragma once

#include <memory>
#include <recfetch/config.hpp>
#include <recfetch/session_provider.hpp>

namespace recfetch::session {

// Logs in to the platform over HTTP(S) and reads recording pages.
// Reuses <session dir>/cookies.json when the saved session is still valid.
class PageSessionProvider : public SessionProvider {
   public:
	explicit PageSessionProvider(Config config);
	~PageSessionProvider() override;
	PageSessionProvider(const PageSessionProvider &) = delete;
	PageSessionProvider &operator=(const PageSessionProvider &) = delete;

	Result<void> open() override;
	std::optional<MediaSource> resolve_media_source(
		RecordingNumber number) override;
	[[nodiscard]] std::filesystem::path cookie_jar_path() const override;

	[[nodiscard]] std::filesystem::path saved_session_path() const;

   private:
	struct Impl;
	std::unique_ptr<Impl> m_impl;
};

}  // namespace recfetch::session
