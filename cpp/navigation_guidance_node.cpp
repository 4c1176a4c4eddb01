/**
 * Navigation Guidance Node
 *
 * Turns per-frame detections into spoken walking instructions. Detection
 * and depth inference run elsewhere; text-to-speech runs elsewhere. This
 * node owns the decision pipeline, the announcement gates and the speech
 * arbiter that serializes every producer onto one audio channel.
 *
 * Subscriptions:
 *   /detections         - std_msgs/String (JSON, see guide_json.h)
 *   /guidance_enable    - std_msgs/Bool   (every change resets the session)
 *   /scene_description  - std_msgs/String (plain text, spoken as NAVIGATION + interrupt)
 *   /speech_idle        - std_msgs/Bool   (TTS finished the current utterance)
 *
 * Publications:
 *   /speech_request     - std_msgs/String (JSON {text, priority, interrupt})
 *
 * Parameters:
 *   config_file   YAML tunables (walkguide.yaml); defaults when empty
 *   strategy      "partition" | "legacy"; overrides the YAML when set
 *   closest_object_speaker  enable INFORMATION-tier narration
 */

#include <rclcpp/rclcpp.hpp>
#include <std_msgs/msg/bool.hpp>
#include <std_msgs/msg/string.hpp>

#include "clock.h"
#include "detection_normalizer.h"
#include "guide_config.h"
#include "guide_json.h"
#include "navigation_pipeline.h"
#include "speech_arbiter.h"

#include <memory>
#include <string>

// ============================================================================
// ROS adapters
// ============================================================================

/// Clock backed by the node clock (honors use_sim_time).
class RosClock : public walkguide::Clock {
public:
    explicit RosClock(rclcpp::Clock::SharedPtr clock) : clock_(std::move(clock)) {}
    double now() const override { return clock_->now().seconds(); }

private:
    rclcpp::Clock::SharedPtr clock_;
};

/// Publishes speech requests for the TTS process. Never blocks on playback.
class RosSpeechSink : public walkguide::SpeechSink {
public:
    explicit RosSpeechSink(rclcpp::Publisher<std_msgs::msg::String>::SharedPtr pub)
        : pub_(std::move(pub)) {}

    bool speak(const walkguide::SpeechRequest& req) override {
        if (!pub_) return false;
        std_msgs::msg::String msg;
        msg.data = walkguide::format_speech_request(req);
        pub_->publish(msg);
        return true;
    }

    void stop() override {
        // Empty interrupting request flushes the TTS queue
        if (!pub_) return;
        std_msgs::msg::String msg;
        msg.data = "{\"text\":\"\",\"priority\":\"urgent\",\"interrupt\":true}";
        pub_->publish(msg);
    }

private:
    rclcpp::Publisher<std_msgs::msg::String>::SharedPtr pub_;
};

// ============================================================================
// Navigation Guidance Node
// ============================================================================
class NavigationGuidanceNode : public rclcpp::Node {
public:
    NavigationGuidanceNode() : Node("navigation_guidance") {
        this->declare_parameter("config_file", std::string(""));
        this->declare_parameter("strategy", std::string(""));
        this->declare_parameter("closest_object_speaker", false);
        this->declare_parameter("start_enabled", true);

        auto config_file = this->get_parameter("config_file").as_string();
        auto strategy = this->get_parameter("strategy").as_string();

        if (!config_file.empty()) {
            if (walkguide::load_guide_config(config_file, cfg_)) {
                RCLCPP_INFO(this->get_logger(), "Loaded config: %s", config_file.c_str());
            } else {
                RCLCPP_WARN(this->get_logger(),
                    "Config %s not loaded, using defaults", config_file.c_str());
            }
        }
        if (!strategy.empty()) cfg_.strategy = strategy;
        if (this->get_parameter("closest_object_speaker").as_bool()) {
            cfg_.closest_object.enabled = true;
        }

        // Publisher
        speech_pub_ = this->create_publisher<std_msgs::msg::String>("/speech_request", 10);

        normalizer_ = walkguide::DetectionNormalizer(cfg_.depth);
        clock_ = std::make_unique<RosClock>(this->get_clock());
        sink_ = std::make_unique<RosSpeechSink>(speech_pub_);
        arbiter_ = std::make_unique<walkguide::SpeechArbiter>(
            *sink_, *clock_, cfg_.arbiter, cfg_.debug_logging);
        pipeline_ = std::make_unique<walkguide::NavigationPipeline>(
            *arbiter_, *clock_, cfg_);
        pipeline_->set_enabled(this->get_parameter("start_enabled").as_bool());

        // Subscribers; all callbacks funnel through the pipeline/arbiter locks
        cb_group_ = this->create_callback_group(rclcpp::CallbackGroupType::Reentrant);
        rclcpp::SubscriptionOptions opts;
        opts.callback_group = cb_group_;

        detections_sub_ = this->create_subscription<std_msgs::msg::String>(
            "/detections", 10,
            std::bind(&NavigationGuidanceNode::detections_callback, this,
                      std::placeholders::_1), opts);
        enable_sub_ = this->create_subscription<std_msgs::msg::Bool>(
            "/guidance_enable", 10,
            std::bind(&NavigationGuidanceNode::enable_callback, this,
                      std::placeholders::_1), opts);
        scene_sub_ = this->create_subscription<std_msgs::msg::String>(
            "/scene_description", 10,
            std::bind(&NavigationGuidanceNode::scene_callback, this,
                      std::placeholders::_1), opts);
        idle_sub_ = this->create_subscription<std_msgs::msg::Bool>(
            "/speech_idle", 10,
            std::bind(&NavigationGuidanceNode::idle_callback, this,
                      std::placeholders::_1), opts);

        RCLCPP_INFO(this->get_logger(),
            "Navigation guidance started (strategy=%s, closest_object=%s, enabled=%s)",
            pipeline_->strategy_name().c_str(),
            cfg_.closest_object.enabled ? "on" : "off",
            pipeline_->enabled() ? "yes" : "no");
    }

private:
    // ---- Detections ----
    void detections_callback(const std_msgs::msg::String::SharedPtr msg) {
        auto frame = walkguide::parse_detection_frame(msg->data);
        if (!frame) {
            RCLCPP_WARN_THROTTLE(this->get_logger(), *this->get_clock(), 5000,
                "Unparseable detections payload (%zu bytes), frame dropped",
                msg->data.size());
            return;
        }

        // Pixel boxes need the image size to be normalized
        if (!frame->pixel_detections.empty()) {
            if (frame->image_width > 0 && frame->image_height > 0) {
                for (const auto& px : frame->pixel_detections) {
                    frame->detections.push_back(normalizer_.from_pixels(
                        px, frame->image_width, frame->image_height));
                }
            } else {
                RCLCPP_WARN_THROTTLE(this->get_logger(), *this->get_clock(), 5000,
                    "%zu pixel detections without image size, ignored",
                    frame->pixel_detections.size());
            }
        }

        double frame_width = frame->image_width > 0 ? frame->image_width : 1.0;
        auto out = pipeline_->process_frame(frame->detections, frame_width);

        if (out.guidance && out.guidance_spoken) {
            RCLCPP_INFO(this->get_logger(), "Guidance: \"%s\" [%s]",
                out.guidance->text.c_str(), walkguide::to_string(out.guidance->priority));
        }
        RCLCPP_DEBUG_THROTTLE(this->get_logger(), *this->get_clock(), 2000,
            "Frame: %zu detections, arbiter forwarded=%zu dropped=%zu",
            out.detections, arbiter_->forwarded_count(), arbiter_->dropped_count());
    }

    // ---- Session control ----
    void enable_callback(const std_msgs::msg::Bool::SharedPtr msg) {
        if (pipeline_->set_enabled(msg->data)) {
            RCLCPP_INFO(this->get_logger(), "Guidance %s, session reset",
                msg->data ? "enabled" : "disabled");
        }
    }

    // ---- Manual scene analysis ----
    void scene_callback(const std_msgs::msg::String::SharedPtr msg) {
        if (msg->data.empty()) return;
        if (!arbiter_->request(msg->data, walkguide::SpeechPriority::Navigation, true)) {
            RCLCPP_WARN(this->get_logger(), "Scene description not spoken");
        }
    }

    void idle_callback(const std_msgs::msg::Bool::SharedPtr msg) {
        if (msg->data) arbiter_->notify_idle();
    }

    walkguide::GuideConfig cfg_;
    walkguide::DetectionNormalizer normalizer_;

    std::unique_ptr<RosClock> clock_;
    std::unique_ptr<RosSpeechSink> sink_;
    std::unique_ptr<walkguide::SpeechArbiter> arbiter_;
    std::unique_ptr<walkguide::NavigationPipeline> pipeline_;

    rclcpp::CallbackGroup::SharedPtr cb_group_;
    rclcpp::Publisher<std_msgs::msg::String>::SharedPtr speech_pub_;
    rclcpp::Subscription<std_msgs::msg::String>::SharedPtr detections_sub_;
    rclcpp::Subscription<std_msgs::msg::Bool>::SharedPtr enable_sub_;
    rclcpp::Subscription<std_msgs::msg::String>::SharedPtr scene_sub_;
    rclcpp::Subscription<std_msgs::msg::Bool>::SharedPtr idle_sub_;
};

// ============================================================================
// Main
// ============================================================================
int main(int argc, char** argv) {
    rclcpp::init(argc, argv);
    auto node = std::make_shared<NavigationGuidanceNode>();
    rclcpp::executors::MultiThreadedExecutor exec;
    exec.add_node(node);
    exec.spin();
    rclcpp::shutdown();
    return 0;
}
