#pragma once

namespace pva {

// Implemented by the rendering/playback layer.
class PlaybackTransport {
public:
	virtual ~PlaybackTransport() = default;

	virtual void pause() = 0;
	virtual void seek(double position_seconds) = 0;
	virtual void stop() = 0;
};

} // namespace pva
