#include "sqlite_repository.hpp"

#include <sqlite3.h>

namespace reel::db::sqlite {

using reel::db::ErrorCode;
using reel::db::Result;

namespace {

using Statement = std::unique_ptr<sqlite3_stmt, decltype(&sqlite3_finalize)>;

constexpr const char* kTaskColumns =
    "id,owner_id,prompt,config,status,stage,stage_progress,message,error,result,created_at_ms,updated_at_ms,sequence";

constexpr const char* kSceneColumns =
    "task_id,idx,title,script_text,visual_prompt,audio_prompt,music_prompt,weight,target_duration,actual_duration,"
    "image_ref,speech_ref,music_ref,mixed_audio_ref,video_ref,final_scene_ref";

Statement Prepare(sqlite3* db, const std::string& sql) {
    sqlite3_stmt* st = nullptr;
    if (sqlite3_prepare_v2(db, sql.c_str(), -1, &st, nullptr) != SQLITE_OK) {
        return Statement(nullptr, &sqlite3_finalize);
    }
    return Statement(st, &sqlite3_finalize);
}

void BindText(sqlite3_stmt* st, int idx, const std::string& s) {
    sqlite3_bind_text(st, idx, s.c_str(), -1, SQLITE_TRANSIENT);
}

void BindU64(sqlite3_stmt* st, int idx, uint64_t v) {
    sqlite3_bind_int64(st, idx, static_cast<sqlite3_int64>(v));
}

void BindDouble(sqlite3_stmt* st, int idx, double v) {
    sqlite3_bind_double(st, idx, v);
}

std::string ColText(sqlite3_stmt* st, int col) {
    const unsigned char* t = sqlite3_column_text(st, col);
    return t ? reinterpret_cast<const char*>(t) : "";
}

uint64_t ColU64(sqlite3_stmt* st, int col) {
    return static_cast<uint64_t>(sqlite3_column_int64(st, col));
}

double ColDouble(sqlite3_stmt* st, int col) {
    return sqlite3_column_double(st, col);
}

// Binds every task column except id, starting at first.
int BindTaskFields(sqlite3_stmt* st, int first, const model::TaskRecord& r) {
    int i = first;
    BindText(st, i++, r.owner_id);
    BindText(st, i++, r.prompt);
    BindText(st, i++, r.config_json);
    BindText(st, i++, r.status);
    BindText(st, i++, r.stage);
    BindText(st, i++, r.stage_progress_json);
    BindText(st, i++, r.message);
    BindText(st, i++, r.error_json);
    BindText(st, i++, r.result_json);
    BindU64(st, i++, r.created_at_ms);
    BindU64(st, i++, r.updated_at_ms);
    BindU64(st, i++, r.sequence);
    return i;
}

model::TaskRecord ReadTask(sqlite3_stmt* st) {
    model::TaskRecord r;
    r.id                  = ColText(st, 0);
    r.owner_id            = ColText(st, 1);
    r.prompt              = ColText(st, 2);
    r.config_json         = ColText(st, 3);
    r.status              = ColText(st, 4);
    r.stage               = ColText(st, 5);
    r.stage_progress_json = ColText(st, 6);
    r.message             = ColText(st, 7);
    r.error_json          = ColText(st, 8);
    r.result_json         = ColText(st, 9);
    r.created_at_ms       = ColU64(st, 10);
    r.updated_at_ms       = ColU64(st, 11);
    r.sequence            = ColU64(st, 12);
    return r;
}

model::SceneRecord ReadScene(sqlite3_stmt* st) {
    model::SceneRecord r;
    r.task_id         = ColText(st, 0);
    r.index           = static_cast<uint32_t>(ColU64(st, 1));
    r.title           = ColText(st, 2);
    r.script_text     = ColText(st, 3);
    r.visual_prompt   = ColText(st, 4);
    r.audio_prompt    = ColText(st, 5);
    r.music_prompt    = ColText(st, 6);
    r.weight          = ColDouble(st, 7);
    r.target_duration = ColDouble(st, 8);
    r.actual_duration = ColDouble(st, 9);
    r.image_ref       = ColText(st, 10);
    r.speech_ref      = ColText(st, 11);
    r.music_ref       = ColText(st, 12);
    r.mixed_audio_ref = ColText(st, 13);
    r.video_ref       = ColText(st, 14);
    r.final_scene_ref = ColText(st, 15);
    return r;
}

std::vector<model::TaskRecord> ReadTasks(sqlite3_stmt* st) {
    std::vector<model::TaskRecord> out;
    while (sqlite3_step(st) == SQLITE_ROW) {
        out.push_back(ReadTask(st));
    }
    return out;
}

} // namespace

SqliteRepository::SqliteRepository(std::shared_ptr<SqliteDB> db)
    : db_(std::move(db)) {}

std::unique_ptr<db::Transaction> SqliteRepository::Begin() {
    return std::make_unique<SqliteTransaction>(db_);
}

SqliteTransaction& SqliteRepository::TX(Transaction& t) {
    return static_cast<SqliteTransaction&>(t);
}

Result SqliteRepository::Translate(sqlite3* db, int rc) {
    if (rc == SQLITE_OK || rc == SQLITE_DONE || rc == SQLITE_ROW)
        return Result::Ok();

    switch (rc & 0xff) {
        case SQLITE_BUSY:
        case SQLITE_LOCKED:
            return Result::Err(ErrorCode::Busy, sqlite3_errmsg(db));
        case SQLITE_CONSTRAINT: {
            const int extended = sqlite3_extended_errcode(db);
            if (extended == SQLITE_CONSTRAINT_PRIMARYKEY || extended == SQLITE_CONSTRAINT_UNIQUE)
                return Result::Err(ErrorCode::AlreadyExists, sqlite3_errmsg(db));
            if (extended == SQLITE_CONSTRAINT_FOREIGNKEY)
                return Result::Err(ErrorCode::NotFound, sqlite3_errmsg(db));
            return Result::Err(ErrorCode::ConstraintViolation, sqlite3_errmsg(db));
        }
        case SQLITE_IOERR:
            return Result::Err(ErrorCode::IOError, sqlite3_errmsg(db));
        case SQLITE_CORRUPT:
            return Result::Err(ErrorCode::Corruption, sqlite3_errmsg(db));
        default:
            return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));
    }
}

// ------------------------------------------------------------------
// Tasks
// ------------------------------------------------------------------

Result SqliteRepository::InsertTask(Transaction& t, const model::TaskRecord& r) {
    auto* db = TX(t).Handle();

    auto st = Prepare(db, std::string("INSERT INTO generation_task(") + kTaskColumns + ") VALUES(?,?,?,?,?,?,?,?,?,?,?,?,?);");
    if (!st) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

    BindText(st.get(), 1, r.id);
    BindTaskFields(st.get(), 2, r);

    return Translate(db, sqlite3_step(st.get()));
}

std::optional<model::TaskRecord>
SqliteRepository::GetTask(Transaction& t, const std::string& id) {
    auto* db = TX(t).Handle();

    auto st = Prepare(db, std::string("SELECT ") + kTaskColumns + " FROM generation_task WHERE id=?;");
    if (!st) return std::nullopt;

    BindText(st.get(), 1, id);

    if (sqlite3_step(st.get()) != SQLITE_ROW) return std::nullopt;
    return ReadTask(st.get());
}

std::vector<model::TaskRecord> SqliteRepository::ListTasks(Transaction& t) {
    auto* db = TX(t).Handle();

    auto st = Prepare(db, std::string("SELECT ") + kTaskColumns + " FROM generation_task ORDER BY created_at_ms, id;");
    if (!st) return {};
    return ReadTasks(st.get());
}

std::vector<model::TaskRecord> SqliteRepository::ListTasksByOwner(Transaction& t, const std::string& owner_id) {
    auto* db = TX(t).Handle();

    auto st = Prepare(db, std::string("SELECT ") + kTaskColumns + " FROM generation_task WHERE owner_id=? ORDER BY created_at_ms, id;");
    if (!st) return {};

    BindText(st.get(), 1, owner_id);
    return ReadTasks(st.get());
}

Result SqliteRepository::UpdateTask(Transaction& t, const model::TaskRecord& r) {
    auto* db = TX(t).Handle();

    auto st = Prepare(db,
        "UPDATE generation_task SET owner_id=?,prompt=?,config=?,status=?,stage=?,stage_progress=?,message=?,error=?,result=?,"
        "created_at_ms=?,updated_at_ms=?,sequence=? WHERE id=?;");
    if (!st) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

    const int next = BindTaskFields(st.get(), 1, r);
    BindText(st.get(), next, r.id);

    int rc = sqlite3_step(st.get());
    if (rc == SQLITE_DONE && sqlite3_changes(db) == 0)
        return Result::Err(ErrorCode::NotFound, "task not found: " + r.id);

    return Translate(db, rc);
}

Result SqliteRepository::DeleteTask(Transaction& t, const std::string& id) {
    auto* db = TX(t).Handle();

    // scenes go with the task through ON DELETE CASCADE
    auto st = Prepare(db, "DELETE FROM generation_task WHERE id=?;");
    if (!st) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

    BindText(st.get(), 1, id);
    return Translate(db, sqlite3_step(st.get()));
}

// ------------------------------------------------------------------
// Scenes
// ------------------------------------------------------------------

Result SqliteRepository::UpsertScene(Transaction& t, const model::SceneRecord& r) {
    auto* db = TX(t).Handle();

    auto st = Prepare(db, std::string("INSERT INTO scene(") + kSceneColumns +
        ") VALUES(?,?,?,?,?,?,?,?,?,?,?,?,?,?,?,?) "
        "ON CONFLICT(task_id, idx) DO UPDATE SET title=excluded.title, script_text=excluded.script_text, "
        "visual_prompt=excluded.visual_prompt, audio_prompt=excluded.audio_prompt, music_prompt=excluded.music_prompt, "
        "weight=excluded.weight, target_duration=excluded.target_duration, actual_duration=excluded.actual_duration, "
        "image_ref=excluded.image_ref, speech_ref=excluded.speech_ref, music_ref=excluded.music_ref, "
        "mixed_audio_ref=excluded.mixed_audio_ref, video_ref=excluded.video_ref, final_scene_ref=excluded.final_scene_ref;");
    if (!st) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

    BindText(st.get(), 1, r.task_id);
    BindU64(st.get(), 2, r.index);
    BindText(st.get(), 3, r.title);
    BindText(st.get(), 4, r.script_text);
    BindText(st.get(), 5, r.visual_prompt);
    BindText(st.get(), 6, r.audio_prompt);
    BindText(st.get(), 7, r.music_prompt);
    BindDouble(st.get(), 8, r.weight);
    BindDouble(st.get(), 9, r.target_duration);
    BindDouble(st.get(), 10, r.actual_duration);
    BindText(st.get(), 11, r.image_ref);
    BindText(st.get(), 12, r.speech_ref);
    BindText(st.get(), 13, r.music_ref);
    BindText(st.get(), 14, r.mixed_audio_ref);
    BindText(st.get(), 15, r.video_ref);
    BindText(st.get(), 16, r.final_scene_ref);

    return Translate(db, sqlite3_step(st.get()));
}

std::vector<model::SceneRecord> SqliteRepository::ListScenes(Transaction& t, const std::string& task_id) {
    auto* db = TX(t).Handle();

    auto st = Prepare(db, std::string("SELECT ") + kSceneColumns + " FROM scene WHERE task_id=? ORDER BY idx;");
    if (!st) return {};

    BindText(st.get(), 1, task_id);

    std::vector<model::SceneRecord> out;
    while (sqlite3_step(st.get()) == SQLITE_ROW) {
        out.push_back(ReadScene(st.get()));
    }
    return out;
}

} // namespace reel::db::sqlite
