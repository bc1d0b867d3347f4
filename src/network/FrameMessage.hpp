/******************************************************************************
 * @brief Defines the IncomingFrame struct and the decoder for the JSON messages
 *      the eye tracker publishes.
 *
 * @file FrameMessage.hpp
 * @author clayjay3 (claytonraycowen@gmail.com)
 * @date 2025-12-29
 *
 * @copyright Copyright RoveSoSeniorDesign 2025 - All Rights Reserved
 ******************************************************************************/

#ifndef FRAME_MESSAGE_HPP
#define FRAME_MESSAGE_HPP

#include "../util/EncodingOperations.hpp"
#include "../util/vision/ImageOperations.hpp"

/// \cond
#include <nlohmann/json.hpp>
#include <opencv2/opencv.hpp>

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

/// \endcond

/******************************************************************************
 * @brief One scene camera frame and the gaze sample that belongs to it.
 ******************************************************************************/
struct IncomingFrame
{
    public:
        cv::Mat cvImage;                          // Decoded BGR scene frame.
        double dGazeX        = 0.0;               // Normalized, 0..1 when on frame.
        double dGazeY        = 0.0;               // Normalized, 0..1 when on frame.
        int64_t nFrameNumber = 0;                 // Sender's picture number.
        double dScoreRight   = 0.0;
        double dScoreLeft    = 0.0;
        std::optional<std::string> szSystemTime;  // "YYYY:MM:DD:HH:MM:SS:MS", if sent.
};

namespace FrameMessage
{
    /******************************************************************************
     * @brief Decodes one message. Required fields are "frame" (integer),
     *      "gaze_x" and "gaze_y" (numbers) and "image" (base64 of a compressed
     *      image). "score_right" and "score_left" default to 0, "system_time" is
     *      optional.
     *
     * @param szPayload - The raw message text.
     * @param szError - Set to the reason when decoding fails.
     * @return std::optional<IncomingFrame> - The frame, nullopt if the message is
     *      malformed.
     *
     * @author clayjay3 (claytonraycowen@gmail.com)
     * @date 2025-12-29
     ******************************************************************************/
    inline std::optional<IncomingFrame> Decode(std::string_view szPayload, std::string& szError)
    {
        nlohmann::json jsMessage;
        try
        {
            jsMessage = nlohmann::json::parse(szPayload.begin(), szPayload.end());
        }
        catch (const nlohmann::json::parse_error& jsError)
        {
            szError = std::string("invalid JSON: ") + jsError.what();
            return std::nullopt;
        }

        if (!jsMessage.is_object())
        {
            szError = "message is not a JSON object";
            return std::nullopt;
        }

        // Required fields.
        if (!jsMessage.contains("frame") || !jsMessage["frame"].is_number_integer())
        {
            szError = "missing or non-integer 'frame'";
            return std::nullopt;
        }
        if (!jsMessage.contains("gaze_x") || !jsMessage["gaze_x"].is_number() || !jsMessage.contains("gaze_y") || !jsMessage["gaze_y"].is_number())
        {
            szError = "missing or non-numeric 'gaze_x'/'gaze_y'";
            return std::nullopt;
        }
        if (!jsMessage.contains("image") || !jsMessage["image"].is_string())
        {
            szError = "missing or non-string 'image'";
            return std::nullopt;
        }

        IncomingFrame stFrame;
        stFrame.nFrameNumber = jsMessage["frame"].get<int64_t>();
        stFrame.dGazeX       = jsMessage["gaze_x"].get<double>();
        stFrame.dGazeY       = jsMessage["gaze_y"].get<double>();

        // Optional fields. Anything that isn't a number counts as absent.
        if (jsMessage.contains("score_right") && jsMessage["score_right"].is_number())
        {
            stFrame.dScoreRight = jsMessage["score_right"].get<double>();
        }
        if (jsMessage.contains("score_left") && jsMessage["score_left"].is_number())
        {
            stFrame.dScoreLeft = jsMessage["score_left"].get<double>();
        }
        if (jsMessage.contains("system_time") && jsMessage["system_time"].is_string())
        {
            stFrame.szSystemTime = jsMessage["system_time"].get<std::string>();
        }

        // Image payload.
        std::optional<std::vector<uint8_t>> vImageBytes = encodeops::Base64Decode(jsMessage["image"].get_ref<const std::string&>());
        if (!vImageBytes.has_value())
        {
            szError = "'image' is not valid base64";
            return std::nullopt;
        }

        stFrame.cvImage = imgops::DecodeImage(*vImageBytes);
        if (stFrame.cvImage.empty())
        {
            szError = "'image' could not be decoded as an image";
            return std::nullopt;
        }

        return stFrame;
    }
}    // namespace FrameMessage

#endif    // FRAME_MESSAGE_HPP
