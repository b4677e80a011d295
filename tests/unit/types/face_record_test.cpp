#include <gtest/gtest.h>

#include <limits>

#include "face_core/errors.hpp"
#include "face_core/types/face_record.hpp"

using namespace face_core;

namespace {

NewFace valid_face() {
  NewFace face;
  face.embedding = {1.0f, 0.0f, 0.0f, 0.0f};
  face.photo = "albums/2023/beach.jpg";
  face.bbox = {10, 20, 30, 40};
  face.confidence = 0.9f;
  return face;
}

}  // namespace

TEST(FaceRecordTest, ValidFacePassesValidation) {
  EXPECT_NO_THROW(validate_face(valid_face()));
}

TEST(FaceRecordTest, RejectsDegenerateBoundingBox) {
  NewFace face = valid_face();
  face.bbox.width = 0;

  EXPECT_THROW(validate_face(face), InvalidFaceRecord);
}

TEST(FaceRecordTest, RejectsBoundingBoxOutsideImage) {
  NewFace face = valid_face();
  face.metadata.image_width = 35;

  EXPECT_THROW(validate_face(face), InvalidFaceRecord);
}

TEST(FaceRecordTest, RejectsBoundingBoxNearIntMaxWithoutOverflow) {
  NewFace face = valid_face();
  face.bbox = {std::numeric_limits<int>::max() - 100, 0, 1000, 10};
  face.metadata.image_width = 4000;
  face.metadata.image_height = 3000;

  EXPECT_THROW(validate_face(face), InvalidFaceRecord);

  face.bbox = {0, std::numeric_limits<int>::max() - 5, 10, 10};
  EXPECT_THROW(validate_face(face), InvalidFaceRecord);
}

TEST(FaceRecordTest, RejectsNonPositiveImageDimensions) {
  NewFace face = valid_face();
  face.metadata.image_width = -1;

  EXPECT_THROW(validate_face(face), InvalidFaceRecord);

  face.metadata.image_width.reset();
  face.metadata.image_height = 0;
  EXPECT_THROW(validate_face(face), InvalidFaceRecord);
}

TEST(FaceRecordTest, RejectsConfidenceOutsideUnitInterval) {
  NewFace face = valid_face();
  face.confidence = 1.5f;

  EXPECT_THROW(validate_face(face), InvalidFaceRecord);
}

TEST(FaceRecordTest, RejectsEmptyPhoto) {
  NewFace face = valid_face();
  face.photo.clear();

  EXPECT_THROW(validate_face(face), InvalidFaceRecord);
}

TEST(FaceRecordTest, MetadataJsonKeepsOnlySetFields) {
  FaceMetadata metadata;
  metadata.location_name = "Lisbon";
  metadata.latitude = 38.72;
  metadata.longitude = -9.14;

  nlohmann::json json = metadata_to_json(metadata);

  EXPECT_EQ(json["schema_version"], FaceMetadata::SCHEMA_VERSION);
  EXPECT_EQ(json["location_name"], "Lisbon");
  EXPECT_FALSE(json.contains("timestamp"));

  FaceMetadata parsed = metadata_from_json(json);
  EXPECT_EQ(parsed.location_name, metadata.location_name);
  EXPECT_TRUE(parsed.has_coordinates());
  EXPECT_FALSE(parsed.timestamp.has_value());
}

TEST(FaceRecordTest, MetadataIgnoresUnknownKeys) {
  nlohmann::json json = {{"schema_version", 1}, {"timestamp", "2023:07:14 10:00:00"}, {"lens", "50mm"}};

  FaceMetadata parsed = metadata_from_json(json);

  ASSERT_TRUE(parsed.timestamp.has_value());
  EXPECT_EQ(*parsed.timestamp, "2023:07:14 10:00:00");
}

TEST(FaceRecordTest, MetadataRejectsNewerSchemaVersion) {
  nlohmann::json json = {{"schema_version", FaceMetadata::SCHEMA_VERSION + 1}};

  EXPECT_THROW(metadata_from_json(json), std::invalid_argument);
}

TEST(FaceRecordTest, MetadataRejectsWrongFieldType) {
  nlohmann::json json = {{"latitude", "north"}};

  EXPECT_THROW(metadata_from_json(json), std::invalid_argument);
}

TEST(FaceRecordTest, PhotoDisplayNameIsLastPathComponent) {
  EXPECT_EQ(photo_display_name("uploads/room1/IMG_001.jpg"), "IMG_001.jpg");
  EXPECT_EQ(photo_display_name("IMG_002.jpg"), "IMG_002.jpg");
}
