#include "sqlite_schema.hpp"

#include <string>
#include <vector>

namespace reel::db::sqlite {

void BootstrapSchema(SqliteDB& db) {
  static const std::vector<std::string> kBootstrapSql = {
      "CREATE TABLE IF NOT EXISTS generation_task (id TEXT PRIMARY KEY, owner_id TEXT NOT NULL, prompt TEXT NOT NULL, config TEXT NOT NULL, "
      "status TEXT NOT NULL, stage TEXT NOT NULL, stage_progress TEXT NOT NULL, message TEXT, error TEXT, result TEXT, "
      "created_at_ms INTEGER NOT NULL, updated_at_ms INTEGER NOT NULL, sequence INTEGER NOT NULL);",
      "CREATE INDEX IF NOT EXISTS generation_task_owner ON generation_task(owner_id, created_at_ms);",
      "CREATE TABLE IF NOT EXISTS scene (task_id TEXT NOT NULL, idx INTEGER NOT NULL, title TEXT, script_text TEXT, visual_prompt TEXT, "
      "audio_prompt TEXT, music_prompt TEXT, weight REAL NOT NULL, target_duration REAL NOT NULL, actual_duration REAL NOT NULL, "
      "image_ref TEXT, speech_ref TEXT, music_ref TEXT, mixed_audio_ref TEXT, video_ref TEXT, final_scene_ref TEXT, "
      "PRIMARY KEY (task_id, idx), FOREIGN KEY(task_id) REFERENCES generation_task(id) ON DELETE CASCADE);"};

  for (const auto& sql : kBootstrapSql) {
    db.Exec(sql);
  }

  db.Exec("SELECT id,owner_id,prompt,config,status,stage,stage_progress,message,error,result,created_at_ms,updated_at_ms,sequence "
          "FROM generation_task LIMIT 1;");
  db.Exec("SELECT task_id,idx,weight,target_duration,actual_duration,image_ref,final_scene_ref FROM scene LIMIT 1;");
}

} // namespace reel::db::sqlite
