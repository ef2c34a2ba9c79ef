#ifndef WHIPCAST_TESTS_FIXTURES_FAKE_PEER_CONNECTION_HPP_
#define WHIPCAST_TESTS_FIXTURES_FAKE_PEER_CONNECTION_HPP_

#include <functional>
#include <memory>
#include <string>
#include <vector>

#include "whipcast/whip/IPeerConnection.hpp"

namespace whipcast::tests::fixtures {

// Peer connection whose state and gathering are driven by the test. Emit*
// calls the registered callbacks synchronously; tests call them from the
// scheduler's thread, which is the only thread there is.
class FakePeerConnection : public whip::IPeerConnection {
 public:
  // Scripted behaviour.
  runtime::CallResult add_senders_result = runtime::CallResult::Ok();
  runtime::CallResult create_offer_result = runtime::CallResult::Ok();
  runtime::CallResult remote_answer_result = runtime::CallResult::Ok();
  bool gathering_complete_after_offer = true;
  bool restart_ice_supported = true;
  std::string candidates;

  void OnStateChange(std::function<void(whip::PeerState)> callback) override {
    on_state_ = std::move(callback);
  }
  void OnGatheringComplete(std::function<void()> callback) override {
    on_gathering_ = std::move(callback);
  }

  runtime::CallResult AddMediaSenders() override {
    ++add_senders_calls;
    return add_senders_result;
  }

  runtime::CallResult CreateOffer() override {
    ++create_offer_calls;
    if (create_offer_result.success) {
      offer_created = true;
      gathering_complete = gathering_complete_after_offer;
    }
    return create_offer_result;
  }

  bool IsGatheringComplete() const override { return gathering_complete; }

  std::string LocalDescription() const override {
    return offer_created ? "v=0\r\ns=fake-offer\r\n" + candidates : std::string();
  }

  runtime::CallResult SetRemoteAnswer(const std::string& sdp) override {
    applied_answer = sdp;
    return remote_answer_result;
  }

  bool RestartIce() override {
    ++restart_ice_calls;
    return restart_ice_supported;
  }

  void SendVideoFrame(const media::VideoFrame&) override { ++video_frames_sent; }
  void SendAudioFrame(const media::AudioFrame& frame) override {
    ++audio_frames_sent;
    last_audio = frame;
  }

  void Close() override {
    if (!closed) ++close_calls;
    closed = true;
    on_state_ = nullptr;
    on_gathering_ = nullptr;
  }

  // Test drivers.
  void EmitState(whip::PeerState state) {
    if (on_state_) on_state_(state);
  }
  void CompleteGathering(const std::string& extra_candidates = "a=candidate:1\r\n") {
    candidates += extra_candidates;
    gathering_complete = true;
    if (on_gathering_) on_gathering_();
  }

  int add_senders_calls = 0;
  int create_offer_calls = 0;
  int restart_ice_calls = 0;
  int close_calls = 0;
  int video_frames_sent = 0;
  int audio_frames_sent = 0;
  media::AudioFrame last_audio;
  std::string applied_answer;
  bool offer_created = false;
  bool gathering_complete = false;
  bool closed = false;

 private:
  std::function<void(whip::PeerState)> on_state_;
  std::function<void()> on_gathering_;
};

// Hands out FakePeerConnections configured by `prototype`, or nullptr while
// fail_creates > 0.
class FakePeerConnectionFactory : public whip::IPeerConnectionFactory {
 public:
  std::function<void(FakePeerConnection&)> prototype;
  int fail_creates = 0;

  std::shared_ptr<whip::IPeerConnection> Create(const whip::PeerConfig& config) override {
    last_config = config;
    ++create_calls;
    if (fail_creates > 0) {
      --fail_creates;
      return nullptr;
    }
    auto pc = std::make_shared<FakePeerConnection>();
    if (prototype) prototype(*pc);
    created.push_back(pc);
    return pc;
  }

  FakePeerConnection& latest() { return *created.back(); }

  int create_calls = 0;
  whip::PeerConfig last_config;
  std::vector<std::shared_ptr<FakePeerConnection>> created;
};

}  // namespace whipcast::tests::fixtures

#endif  // WHIPCAST_TESTS_FIXTURES_FAKE_PEER_CONNECTION_HPP_
