#include <doctest/doctest.h>

#include <facemetrics/pipeline/yunet_adapter.hpp>

#include <opencv2/core.hpp>

namespace {

void SetRow(cv::Mat& faces, int row, float x, float y, float w, float h, float score) {
  faces.at<float>(row, 0) = x;
  faces.at<float>(row, 1) = y;
  faces.at<float>(row, 2) = w;
  faces.at<float>(row, 3) = h;
  // right eye, left eye, nose tip, right and left mouth corners
  const float landmarks[] = {x + 0.25f * w, y + 0.35f * h, x + 0.75f * w, y + 0.35f * h, x + 0.5f * w,
                             y + 0.55f * h, x + 0.3f * w,  y + 0.75f * h, x + 0.7f * w,  y + 0.75f * h};
  for (int i = 0; i < 10; ++i) {
    faces.at<float>(row, 4 + i) = landmarks[i];
  }
  faces.at<float>(row, 14) = score;
}

}  // namespace

TEST_SUITE("facemetrics::YuNetAdapter") {
  TEST_CASE("ConvertYuNetDetections: Converts a row") {
    cv::Mat faces(1, facemetrics::kYuNetRowSize, CV_32F, cv::Scalar(0));
    SetRow(faces, 0, 100.0f, 120.0f, 200.0f, 200.0f, 0.9f);

    const auto detections = facemetrics::ConvertYuNetDetections(faces, 640, 480);
    REQUIRE(detections.has_value());
    REQUIRE_EQ(detections->size(), 1u);

    const auto& detection = detections->front();
    CHECK_EQ(detection.image_width, 640);
    CHECK_EQ(detection.image_height, 480);
    CHECK_EQ(detection.bounding_box_px.left, doctest::Approx(100.0f));
    CHECK_EQ(detection.bounding_box_px.top, doctest::Approx(120.0f));
    CHECK_EQ(detection.bounding_box_px.right, doctest::Approx(300.0f));
    CHECK_EQ(detection.bounding_box_px.bottom, doctest::Approx(320.0f));
    CHECK_EQ(detection.landmarks.Count(), 5u);
    CHECK_FALSE(detection.tracking_id.has_value());
    CHECK_FALSE(detection.smile_prob.has_value());
    CHECK_FALSE(detection.left_eye_open_prob.has_value());
    CHECK_FALSE(detection.right_eye_open_prob.has_value());
    CHECK_EQ(detection.pitch_deg, doctest::Approx(0.0f));
    CHECK_EQ(detection.yaw_deg, doctest::Approx(0.0f));
    CHECK_EQ(detection.roll_deg, doctest::Approx(0.0f));
  }

  TEST_CASE("ConvertYuNetDetections: Landmark mapping") {
    cv::Mat faces(1, facemetrics::kYuNetRowSize, CV_32F, cv::Scalar(0));
    SetRow(faces, 0, 100.0f, 100.0f, 200.0f, 200.0f, 0.9f);

    const auto detections = facemetrics::ConvertYuNetDetections(faces, 640, 480);
    REQUIRE(detections.has_value());
    REQUIRE_EQ(detections->size(), 1u);
    const auto& landmarks = detections->front().landmarks;

    const auto right_eye = landmarks.Get(facemetrics::LandmarkKind::kRightEye);
    const auto left_eye = landmarks.Get(facemetrics::LandmarkKind::kLeftEye);
    const auto nose = landmarks.Get(facemetrics::LandmarkKind::kNoseBase);
    const auto mouth_right = landmarks.Get(facemetrics::LandmarkKind::kMouthRight);
    const auto mouth_left = landmarks.Get(facemetrics::LandmarkKind::kMouthLeft);
    REQUIRE(right_eye.has_value());
    REQUIRE(left_eye.has_value());
    REQUIRE(nose.has_value());
    REQUIRE(mouth_right.has_value());
    REQUIRE(mouth_left.has_value());

    CHECK_EQ(right_eye->x, doctest::Approx(150.0f));
    CHECK_EQ(left_eye->x, doctest::Approx(250.0f));
    CHECK_EQ(nose->y, doctest::Approx(210.0f));
    CHECK_EQ(mouth_right->x, doctest::Approx(160.0f));
    CHECK_EQ(mouth_left->x, doctest::Approx(240.0f));
    CHECK_FALSE(landmarks.Has(facemetrics::LandmarkKind::kLeftEar));
  }

  TEST_CASE("ConvertYuNetDetections: Skips rows below the score threshold") {
    cv::Mat faces(2, facemetrics::kYuNetRowSize, CV_32F, cv::Scalar(0));
    SetRow(faces, 0, 100.0f, 100.0f, 200.0f, 200.0f, 0.3f);
    SetRow(faces, 1, 300.0f, 100.0f, 100.0f, 100.0f, 0.8f);

    const auto detections = facemetrics::ConvertYuNetDetections(faces, 640, 480);
    REQUIRE(detections.has_value());
    REQUIRE_EQ(detections->size(), 1u);
    CHECK_EQ(detections->front().bounding_box_px.left, doctest::Approx(300.0f));

    const auto relaxed = facemetrics::ConvertYuNetDetections(faces, 640, 480, {.score_threshold = 0.2f});
    REQUIRE(relaxed.has_value());
    CHECK_EQ(relaxed->size(), 2u);
  }

  TEST_CASE("ConvertYuNetDetections: Clamps boxes to the frame") {
    cv::Mat faces(1, facemetrics::kYuNetRowSize, CV_32F, cv::Scalar(0));
    SetRow(faces, 0, -20.0f, -10.0f, 200.0f, 200.0f, 0.9f);

    const auto detections = facemetrics::ConvertYuNetDetections(faces, 640, 480);
    REQUIRE(detections.has_value());
    REQUIRE_EQ(detections->size(), 1u);

    const auto& box = detections->front().bounding_box_px;
    CHECK_EQ(box.left, doctest::Approx(0.0f));
    CHECK_EQ(box.top, doctest::Approx(0.0f));
    CHECK_EQ(box.right, doctest::Approx(180.0f));
    CHECK_EQ(box.bottom, doctest::Approx(190.0f));
  }

  TEST_CASE("ConvertYuNetDetections: Drops boxes outside the frame") {
    cv::Mat faces(2, facemetrics::kYuNetRowSize, CV_32F, cv::Scalar(0));
    SetRow(faces, 0, 700.0f, 100.0f, 100.0f, 100.0f, 0.9f);
    SetRow(faces, 1, 100.0f, 100.0f, 0.0f, 100.0f, 0.9f);

    const auto detections = facemetrics::ConvertYuNetDetections(faces, 640, 480);
    REQUIRE(detections.has_value());
    CHECK(detections->empty());
  }

  TEST_CASE("ConvertYuNetDetections: Empty and malformed output") {
    const auto empty = facemetrics::ConvertYuNetDetections(cv::Mat(), 640, 480);
    REQUIRE(empty.has_value());
    CHECK(empty->empty());

    const cv::Mat wrong_type(1, facemetrics::kYuNetRowSize, CV_64F, cv::Scalar(0));
    const auto typed = facemetrics::ConvertYuNetDetections(wrong_type, 640, 480);
    REQUIRE(typed.has_value());
    CHECK(typed->empty());

    const cv::Mat too_narrow(1, 4, CV_32F, cv::Scalar(0));
    const auto narrow = facemetrics::ConvertYuNetDetections(too_narrow, 640, 480);
    REQUIRE(narrow.has_value());
    CHECK(narrow->empty());
  }

  TEST_CASE("ConvertYuNetDetections: Rejects invalid image size") {
    cv::Mat faces(1, facemetrics::kYuNetRowSize, CV_32F, cv::Scalar(0));
    SetRow(faces, 0, 100.0f, 100.0f, 200.0f, 200.0f, 0.9f);

    const auto detections = facemetrics::ConvertYuNetDetections(faces, 0, 480);
    REQUIRE_FALSE(detections.has_value());
    CHECK_EQ(detections.error(), facemetrics::PipelineError::kInvalidImageSize);
  }
}  // TEST_SUITE

TEST_SUITE("facemetrics::EstimateRollFromEyes") {
  TEST_CASE("EstimateRollFromEyes: Level eyes") {
    CHECK_EQ(facemetrics::EstimateRollFromEyes({150.0f, 170.0f}, {250.0f, 170.0f}), doctest::Approx(0.0f));
  }

  TEST_CASE("EstimateRollFromEyes: Tilted eye line") {
    CHECK_EQ(facemetrics::EstimateRollFromEyes({150.0f, 170.0f}, {250.0f, 270.0f}), doctest::Approx(45.0f));
    CHECK_EQ(facemetrics::EstimateRollFromEyes({150.0f, 170.0f}, {250.0f, 70.0f}), doctest::Approx(-45.0f));
  }
}  // TEST_SUITE
