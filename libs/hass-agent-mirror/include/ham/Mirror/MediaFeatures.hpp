#pragma once

namespace ham {

// Host media-player feature bits
enum MediaFeature : int {
    FeaturePause         = 1,
    FeatureSeek          = 2,
    FeatureVolumeSet     = 4,
    FeatureVolumeMute    = 8,
    FeaturePreviousTrack = 16,
    FeatureNextTrack     = 32,
    FeatureTurnOn        = 128,
    FeatureTurnOff       = 256,
    FeaturePlayMedia     = 512,
    FeatureVolumeStep    = 1024,
    FeatureSelectSource  = 2048,
    FeatureStop          = 4096,
    FeatureClearPlaylist = 8192,
    FeaturePlay          = 16384,
    FeatureShuffleSet    = 32768,
    FeatureBrowseMedia   = 131072
};

constexpr int AGENT_SUPPORTED_FEATURES =
    FeatureVolumeMute | FeaturePause | FeatureStop | FeaturePreviousTrack
    | FeatureNextTrack | FeatureVolumeStep | FeaturePlay | FeaturePlayMedia
    | FeatureSeek | FeatureBrowseMedia | FeatureVolumeSet | FeatureTurnOff;

constexpr const char* AGENT_DEVICE_CLASS = "speaker";
constexpr const char* AGENT_MEDIA_CONTENT_TYPE = "music";

} // namespace ham
